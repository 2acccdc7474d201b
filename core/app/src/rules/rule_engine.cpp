#include "optrisk/rules/rule_engine.hpp"
#include "optrisk/rules/hard_limit_rule.hpp"
#include "optrisk/rules/secure_profit_rule.hpp"
#include "optrisk/rules/session_end_rule.hpp"
#include "optrisk/rules/tiered_offset_rule.hpp"
#include "optrisk/rules/trailing_rule.hpp"
#include "optrisk/rules/underlying_exit_rule.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace optrisk {

RuleEngine::RuleEngine(std::vector<std::unique_ptr<IExitRule>> rules)
    : rules_(std::move(rules)) {}

// -----------------------------------------------------------------------------
// evaluate: first Exit wins; a throwing rule is isolated
// -----------------------------------------------------------------------------
Decision RuleEngine::evaluate(const domain::Position& position,
                              const RuleContext& context) {
  if (position.status != domain::PositionStatus::Open) {
    return Decision::noAction();
  }

  for (const auto& rule : rules_) {
    if (!rule->enabled()) {
      continue;
    }

    try {
      Decision decision = rule->evaluate(position, context);
      if (decision.isExit()) {
        if (decision.rule.empty()) {
          decision.rule = rule->name();
        }
        return decision;
      }
    } catch (const std::exception& e) {
      std::cerr << "[RuleEngine] " << rule->name() << " failed for position "
                << position.id << ": " << e.what() << "\n";
    }
  }

  return Decision::noAction();
}

// -----------------------------------------------------------------------------
// buildDefaultRuleChain: production priority order
// -----------------------------------------------------------------------------
std::vector<std::unique_ptr<IExitRule>> buildDefaultRuleChain(
    const config::EngineConfig& config, TrailingEngine& trailing) {
  std::vector<std::unique_ptr<IExitRule>> rules;
  rules.push_back(std::make_unique<UnderlyingExitRule>(config.underlying_exit));
  rules.push_back(std::make_unique<HardLimitRule>(config.hard_limits));
  rules.push_back(std::make_unique<SecureProfitRule>(config.hard_limits));
  rules.push_back(std::make_unique<TieredOffsetRule>(trailing));
  rules.push_back(std::make_unique<TrailingRule>(trailing));
  rules.push_back(
      std::make_unique<SessionEndRule>(config.session, config.time_stop));
  return rules;
}

}  // namespace optrisk
