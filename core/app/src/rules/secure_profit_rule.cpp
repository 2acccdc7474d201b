#include "optrisk/rules/secure_profit_rule.hpp"

#include <cstdio>
#include <utility>

namespace optrisk {

namespace {

std::string secureProfitReason(double pnl, double drawdown, double peak) {
  char buffer[128];
  std::snprintf(buffer, sizeof(buffer),
                "secure_profit_exit (profit: %.2f, drawdown: %.2f%% from peak "
                "%.2f%%)",
                pnl, drawdown, peak);
  return buffer;
}

}  // namespace

SecureProfitRule::SecureProfitRule(config::HardLimitConfig config)
    : config_(std::move(config)) {}

Decision SecureProfitRule::evaluate(const domain::Position& position,
                                    const RuleContext& /*context*/) {
  const double threshold = config_.secure_profit_threshold_rupees;
  if (!(position.ltp > 0.0) || !(threshold > 0.0) || !(position.pnl > 0.0)) {
    return Decision::noAction();
  }
  if (position.pnl < threshold) {
    return Decision::noAction();
  }

  const double drawdown = position.peak_profit_pct - position.pnl_pct;
  if (drawdown < config_.secure_profit_drawdown_pct) {
    return Decision::noAction();
  }

  return Decision::exit(
      secureProfitReason(position.pnl, drawdown, position.peak_profit_pct),
      name_);
}

}  // namespace optrisk
