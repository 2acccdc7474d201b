#pragma once

#include "optrisk/config/engine_config.hpp"
#include "optrisk/rules/i_exit_rule.hpp"

namespace optrisk {

// -----------------------------------------------------------------------------
// SecureProfitRule: tighter peak give-back once a rupee profit is banked
// -----------------------------------------------------------------------------
//
// @details
// Enabled by hard_limits.secure_profit_enabled. Once open pnl reaches
// secure_profit_threshold_rupees (default 1000), a drop of
// secure_profit_drawdown_pct (default 3) percentage points from the peak
// exits:
//
//   pnl ≥ threshold  and  peak − pnl_pct ≥ drawdown  → secure_profit_exit
//
// Sits after HardLimitRule and before the trailing pair, so it pre-empts the
// wider peak-drawdown check on positions that are well in the money.
// A threshold of 0 disables the rule even when enabled.
// -----------------------------------------------------------------------------
class SecureProfitRule final : public IExitRule {
 public:
  explicit SecureProfitRule(config::HardLimitConfig config);

  Decision evaluate(const domain::Position& position,
                    const RuleContext& context) override;

  const std::string& name() const override { return name_; }
  bool enabled() const override { return config_.secure_profit_enabled; }

 private:
  const config::HardLimitConfig config_;
  const std::string name_{"SecureProfitRule"};
};

}  // namespace optrisk
