#include "optrisk/risk/drawdown_schedule.hpp"
#include "optrisk/domain/position.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace optrisk {

DrawdownSchedule::DrawdownSchedule(config::DrawdownConfig drawdown,
                                   config::ReverseLossConfig reverse_loss)
    : drawdown_(std::move(drawdown)), reverse_loss_(std::move(reverse_loss)) {}

// -----------------------------------------------------------------------------
// floorFor: per-class floor, dd_end_pct when the class has none
// -----------------------------------------------------------------------------
double DrawdownSchedule::floorFor(const std::string& instrument_class) const {
  auto it = drawdown_.index_floors.find(instrument_class);
  if (it != drawdown_.index_floors.end()) {
    return it->second;
  }
  return drawdown_.dd_end_pct;
}

// -----------------------------------------------------------------------------
// allowedUpwardDrawdown: exponential decay from dd_start to dd_end
// -----------------------------------------------------------------------------
std::optional<double> DrawdownSchedule::allowedUpwardDrawdown(
    double peak_profit_pct, const std::string& instrument_class) const {
  // A peak of zero (or below) means the position never made money; the
  // curve has nothing to protect even when profit_min is configured ≤ 0.
  if (peak_profit_pct <= 0.0 || peak_profit_pct < drawdown_.profit_min) {
    return std::nullopt;
  }

  double span = drawdown_.profit_max - drawdown_.profit_min;
  double normalized =
      std::clamp((peak_profit_pct - drawdown_.profit_min) / span, 0.0, 1.0);

  double raw = drawdown_.dd_end_pct +
               (drawdown_.dd_start_pct - drawdown_.dd_end_pct) *
                   std::exp(-drawdown_.exponential_k * normalized);

  double allowed = std::max(raw, floorFor(instrument_class));
  return domain::roundTo(allowed, 4);
}

// -----------------------------------------------------------------------------
// allowedDownwardLoss: linear tightening, then time and volatility penalties
// -----------------------------------------------------------------------------
double DrawdownSchedule::allowedDownwardLoss(double current_loss_pct,
                                             double seconds_underwater,
                                             double volatility_ratio) const {
  const auto& rl = reverse_loss_;

  double loss = std::min(std::max(current_loss_pct, 0.0), rl.loss_span_pct);
  double allowed =
      rl.max_loss_pct +
      (loss / rl.loss_span_pct) * (rl.min_loss_pct - rl.max_loss_pct);

  double minutes_underwater = std::max(seconds_underwater, 0.0) / 60.0;
  allowed -= minutes_underwater * rl.time_tighten_per_min;

  for (const auto& row : rl.volatility_penalties) {
    if (volatility_ratio <= row.threshold) {
      allowed -= row.penalty_pct;
      break;
    }
  }

  allowed = std::clamp(allowed, rl.min_loss_pct, rl.max_loss_pct);
  return domain::roundTo(allowed, 4);
}

}  // namespace optrisk
