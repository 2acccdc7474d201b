#pragma once

#include "optrisk/config/engine_config.hpp"
#include "optrisk/rules/i_exit_rule.hpp"

namespace optrisk {

// -----------------------------------------------------------------------------
// HardLimitRule: static stops, trailing stop level and rupee circuit breakers
// -----------------------------------------------------------------------------
//
// @details
// Always enabled. Checks, in order, first hit wins:
//
//   1. pnl ≤ −max_loss_rupees                         → hard_rupee_sl
//   2. pnl_pct ≤ effective SL                         → stop_loss_hit
//                                                       or trailing_stop_hit
//   3. pnl_pct ≥ take-profit pct                      → take_profit_hit
//   4. pnl ≥ target_profit_rupees                     → hard_rupee_tp
//
// Effective SL = the higher (more protective) of the static SL, converted to
// pnl percent, and the stored trailing offset. The reason says which one was
// binding: trailing_stop_hit when the offset is strictly tighter.
//
// Rupee limits come from the position's thresholds, falling back to the
// configured defaults; 0 or absent disables them.
//
// Positions that have not received a tick yet are skipped: with ltp 0 their
// pnl is meaningless.
// -----------------------------------------------------------------------------
class HardLimitRule final : public IExitRule {
 public:
  explicit HardLimitRule(config::HardLimitConfig config);

  Decision evaluate(const domain::Position& position,
                    const RuleContext& context) override;

  const std::string& name() const override { return name_; }

 private:
  double maxLossRupees(const domain::Position& position) const;
  double targetProfitRupees(const domain::Position& position) const;

  const config::HardLimitConfig config_;
  const std::string name_{"HardLimitRule"};
};

}  // namespace optrisk
