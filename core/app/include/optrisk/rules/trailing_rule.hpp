#pragma once

#include "optrisk/risk/trailing_engine.hpp"
#include "optrisk/rules/i_exit_rule.hpp"

namespace optrisk {

// -----------------------------------------------------------------------------
// TrailingRule: peak-drawdown, adaptive and reverse-loss exits
// -----------------------------------------------------------------------------
// Thin adapter so TrailingEngine::evaluate takes its slot in the chain.
// -----------------------------------------------------------------------------
class TrailingRule final : public IExitRule {
 public:
  explicit TrailingRule(TrailingEngine& trailing) : trailing_(trailing) {}

  Decision evaluate(const domain::Position& position,
                    const RuleContext& context) override;

  const std::string& name() const override { return name_; }

 private:
  TrailingEngine& trailing_;
  const std::string name_{"TrailingRule"};
};

}  // namespace optrisk
