#pragma once

#include "optrisk/config/engine_config.hpp"
#include "optrisk/domain/position.hpp"
#include "optrisk/risk/trailing_engine.hpp"
#include "optrisk/rules/decision.hpp"
#include "optrisk/rules/i_exit_rule.hpp"
#include "optrisk/rules/rule_context.hpp"

#include <memory>
#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// RuleEngine: priority-ordered exit evaluation
// -----------------------------------------------------------------------------
//
// @brief  Runs a fixed list of IExitRule over one position and returns the
//         first Exit, or NoAction.
//
// @details
// Evaluation contract:
//   - Positions whose status is not Open (an exit is in flight) are skipped.
//   - Disabled rules are skipped without being called.
//   - The first Exit wins; later rules are not evaluated.
//   - A std::exception thrown by a rule is logged with the rule name and the
//     position id, and counts as NoAction for that rule only. The chain
//     continues with the next rule.
//
// The default chain (buildDefaultRuleChain):
//
//   1. UnderlyingExitRule   (underlying_exit.enabled)
//   2. HardLimitRule
//   3. SecureProfitRule     (hard_limits.secure_profit_enabled)
//   4. TieredOffsetRule     (tiered mode; never exits)
//   5. TrailingRule
//   6. SessionEndRule
//
// Thread model:
//   Sweep thread (and IPC thread for nothing but reads of rules()). Not
//   reentrant for the same position.
//
// Ownership:
//   Owns the rules. Rules referencing TrailingEngine borrow it from
//   RiskManager, which outlives the RuleEngine.
// -----------------------------------------------------------------------------
class RuleEngine {
 public:
  explicit RuleEngine(std::vector<std::unique_ptr<IExitRule>> rules);

  RuleEngine(const RuleEngine&) = delete;
  RuleEngine& operator=(const RuleEngine&) = delete;

  // -------------------------------------------------------------------------
  // evaluate(position, context)
  // -------------------------------------------------------------------------
  // @param  position  Pass-start snapshot from PositionStore::allOpen().
  // @param  context   Per-pass clock reading and providers.
  // @return First Exit decision, or NoAction.
  // -------------------------------------------------------------------------
  Decision evaluate(const domain::Position& position,
                    const RuleContext& context);

  const std::vector<std::unique_ptr<IExitRule>>& rules() const {
    return rules_;
  }

 private:
  std::vector<std::unique_ptr<IExitRule>> rules_;
};

// -----------------------------------------------------------------------------
// buildDefaultRuleChain(config, trailing)
// -----------------------------------------------------------------------------
// @brief  The production rule order, configured from EngineConfig.
// @throws config::ConfigError if session.exit_time is malformed.
// -----------------------------------------------------------------------------
std::vector<std::unique_ptr<IExitRule>> buildDefaultRuleChain(
    const config::EngineConfig& config, TrailingEngine& trailing);

}  // namespace optrisk
