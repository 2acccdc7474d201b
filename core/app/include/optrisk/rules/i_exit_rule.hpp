#pragma once

#include "optrisk/domain/position.hpp"
#include "optrisk/rules/decision.hpp"
#include "optrisk/rules/rule_context.hpp"

#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// IExitRule: one link of the priority-ordered exit chain
// -----------------------------------------------------------------------------
//
// @brief  Looks at a position snapshot and answers NoAction or Exit(reason).
//
// @details
// Rules are composed into a fixed list by buildDefaultRuleChain(); RuleEngine
// walks it in order and stops at the first Exit. There is no capability
// probing at runtime: a rule that does not apply to a position returns
// NoAction.
//
// The snapshot is the one taken at the start of the sweep pass. A rule that
// changes derived state (TieredOffsetRule) goes through PositionStore::update
// and the change is visible from the next pass on.
//
// evaluate() may throw std::exception. RuleEngine logs it under name() and
// treats it as NoAction for this rule only.
//
// Thread model:
//   Called from the sweep thread only. Implementations need not be
//   thread-safe beyond what their collaborators already are.
// -----------------------------------------------------------------------------
class IExitRule {
 public:
  virtual ~IExitRule() = default;

  virtual Decision evaluate(const domain::Position& position,
                            const RuleContext& context) = 0;

  virtual const std::string& name() const = 0;

  // Disabled rules are skipped without being evaluated.
  virtual bool enabled() const { return true; }
};

}  // namespace optrisk
