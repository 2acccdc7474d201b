#pragma once

#include "optrisk/config/engine_config.hpp"

#include <optional>
#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// DrawdownSchedule: profit-protection and loss-tightening curves
// -----------------------------------------------------------------------------
//
// @brief  Pure functions that answer two questions for the TrailingEngine:
//           1. Having peaked at P% profit, how much of it may we give back?
//           2. Being L% under water for S seconds in a V volatility regime,
//              how much more loss do we tolerate?
//
// @details
// Upward curve (profit protection):
//
//   inactive                    if peak ≤ 0 or peak < profit_min
//   normalized = clamp((peak − profit_min) / (profit_max − profit_min), 0, 1)
//   raw        = dd_end + (dd_start − dd_end) · exp(−k · normalized)
//   allowed    = max(raw, floor(class))                  rounded to 4 dp
//
//   With the defaults (3, 30, 15, 1, k=3) a position that peaked at +3% may
//   give back 15 points, one that peaked at +30% only ~1.7 points. The curve
//   is non-increasing in peak and never drops below the class floor.
//
// Downward curve (loss tightening):
//
//   loss    = min(current_loss, loss_span)
//   allowed = max_loss + (loss / loss_span) · (min_loss − max_loss)
//   allowed −= minutes_underwater · time_tighten_per_min
//   allowed −= penalty of the first row with volatility_ratio ≤ threshold
//   allowed  = clamp(allowed, min_loss, max_loss)        rounded to 4 dp
//
//   The deeper and longer a position is under water, and the quieter the
//   underlying, the tighter the stop. Never below min_loss.
//
// Thread model:
//   Immutable after construction; all methods are const and reentrant.
//
// Ownership:
//   Value member of TrailingEngine.
// -----------------------------------------------------------------------------
class DrawdownSchedule {
 public:
  DrawdownSchedule(config::DrawdownConfig drawdown,
                   config::ReverseLossConfig reverse_loss);

  // -------------------------------------------------------------------------
  // allowedUpwardDrawdown(peak_profit_pct, instrument_class)
  // -------------------------------------------------------------------------
  // @param  peak_profit_pct   Best pnl_pct seen since entry.
  // @param  instrument_class  Index key used to look up the floor
  //                           (e.g. "NIFTY"). Unknown classes use dd_end.
  // @return Allowed give-back in percentage points, or std::nullopt when the
  //         curve is not yet active for this peak.
  // -------------------------------------------------------------------------
  std::optional<double> allowedUpwardDrawdown(
      double peak_profit_pct, const std::string& instrument_class) const;

  // -------------------------------------------------------------------------
  // allowedDownwardLoss(current_loss_pct, seconds_underwater, volatility_ratio)
  // -------------------------------------------------------------------------
  // @param  current_loss_pct    Positive magnitude of the current loss.
  // @param  seconds_underwater  Time since PnL first went negative.
  // @param  volatility_ratio    Current ATR / previous ATR (1.0 if unknown).
  // @return Allowed loss in percent, within [min_loss_pct, max_loss_pct].
  // -------------------------------------------------------------------------
  double allowedDownwardLoss(double current_loss_pct,
                             double seconds_underwater,
                             double volatility_ratio) const;

  // Floor for a class: index_floors[class] or dd_end_pct.
  double floorFor(const std::string& instrument_class) const;

 private:
  const config::DrawdownConfig drawdown_;
  const config::ReverseLossConfig reverse_loss_;
};

}  // namespace optrisk
