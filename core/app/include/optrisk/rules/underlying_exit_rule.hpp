#pragma once

#include "optrisk/config/engine_config.hpp"
#include "optrisk/rules/i_exit_rule.hpp"

namespace optrisk {

// -----------------------------------------------------------------------------
// UnderlyingExitRule: exit when the index the option is written on turns
// -----------------------------------------------------------------------------
//
// @details
// Highest priority in the chain: an option leg whose thesis has been
// invalidated on the underlying should go before any price-based rule fires.
// Checks, in order:
//
//   structure broken against the position's direction → underlying_structure_break
//   trend_score < trend_score_threshold                → underlying_trend_weak
//   volatility trend Falling and ratio < multiplier    → underlying_atr_collapse
//
// Requires position.underlying and a fresh snapshot from the provider; with
// either missing the rule is silent.
// -----------------------------------------------------------------------------
class UnderlyingExitRule final : public IExitRule {
 public:
  explicit UnderlyingExitRule(config::UnderlyingExitConfig config);

  Decision evaluate(const domain::Position& position,
                    const RuleContext& context) override;

  const std::string& name() const override { return name_; }
  bool enabled() const override { return config_.enabled; }

 private:
  const config::UnderlyingExitConfig config_;
  const std::string name_{"UnderlyingExitRule"};
};

}  // namespace optrisk
