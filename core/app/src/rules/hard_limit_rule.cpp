#include "optrisk/rules/hard_limit_rule.hpp"

#include <cmath>
#include <utility>

namespace optrisk {

HardLimitRule::HardLimitRule(config::HardLimitConfig config)
    : config_(std::move(config)) {}

double HardLimitRule::maxLossRupees(const domain::Position& position) const {
  return std::abs(
      position.thresholds.max_loss_rupees.value_or(config_.max_loss_rupees));
}

double HardLimitRule::targetProfitRupees(
    const domain::Position& position) const {
  return std::abs(position.thresholds.target_profit_rupees.value_or(
      config_.target_profit_rupees));
}

Decision HardLimitRule::evaluate(const domain::Position& position,
                                 const RuleContext& /*context*/) {
  if (!(position.ltp > 0.0)) {
    return Decision::noAction();
  }

  const double max_loss = maxLossRupees(position);
  if (max_loss > 0.0 && position.pnl <= -max_loss) {
    return Decision::exit("hard_rupee_sl", name_);
  }

  const auto static_sl = domain::stopLossPnlPct(position);
  const auto& trailing_sl = position.sl_offset_pct;
  if (static_sl || trailing_sl) {
    bool trailing_binding =
        trailing_sl && (!static_sl || *trailing_sl > *static_sl);
    double effective = trailing_binding ? *trailing_sl : *static_sl;
    if (position.pnl_pct <= effective) {
      return Decision::exit(
          trailing_binding ? "trailing_stop_hit" : "stop_loss_hit", name_);
    }
  }

  if (auto tp = domain::takeProfitPnlPct(position)) {
    if (position.pnl_pct >= *tp) {
      return Decision::exit("take_profit_hit", name_);
    }
  }

  const double target = targetProfitRupees(position);
  if (target > 0.0 && position.pnl >= target) {
    return Decision::exit("hard_rupee_tp", name_);
  }

  return Decision::noAction();
}

}  // namespace optrisk
