#pragma once

#include "optrisk/config/engine_config.hpp"
#include "optrisk/domain/position.hpp"
#include "optrisk/risk/drawdown_schedule.hpp"
#include "optrisk/risk/position_store.hpp"
#include "optrisk/rules/decision.hpp"
#include "optrisk/rules/rule_context.hpp"

#include <optional>
#include <string>
#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// TrailingEngine: trailing-stop state and trailing exit decisions
// -----------------------------------------------------------------------------
//
// @brief  Turns DrawdownSchedule outputs and the tier table into exits and
//         trailing-offset updates.
//
// @details
// evaluate() runs these checks on the pass-start snapshot, in order:
//
//   1. Peak drawdown (tiered mode)
//        drawdown = peak − current, only when peak > 0
//        exit when drawdown ≥ peak_drawdown_pct                     inclusive
//        gated: additionally requires peak ≥ activation_profit_pct AND
//               stored offset (or static SL) ≥ activation_sl_offset_pct.
//               The gate looks at the peak, never at the current profit.
//        → "peak_drawdown_exit (drawdown: X%, peak: Y%)"
//
//   2. Breakeven lock (both modes, not an exit)
//        pnl_pct ≥ breakeven_after_gain_pct → offset raised to ≥ 0, flagged.
//
//   3. Adaptive upward trailing (adaptive mode)
//        peak − current ≥ allowedUpwardDrawdown(peak, class)
//        → "adaptive_trailing_stop"
//        else, with exit_drop_pct > 0 and hwm > 0:
//        (hwm − pnl) / hwm × 100 ≥ exit_drop_pct → "trailing_stop_fixed"
//
//   4. Downward adaptive stop (reverse_loss.enabled, pnl < 0)
//        −pnl_pct ≥ allowedDownwardLoss(−pnl_pct, seconds underwater,
//                                       underlying volatility_ratio or 1.0)
//        → "adaptive_stop_loss"
//
// applyTieredOffset() is the tier-table tightening used by TieredOffsetRule.
// It is kept here so all trailing-offset writes live in one place.
//
// Thread model:
//   Sweep thread only. Offset writes go through PositionStore::update, which
//   is thread-safe and tighten-only.
//
// Ownership:
//   Owned by RiskManager; holds a reference to the PositionStore.
// -----------------------------------------------------------------------------
class TrailingEngine {
 public:
  TrailingEngine(PositionStore& store, config::TrailingConfig trailing,
                 config::ReverseLossConfig reverse_loss,
                 DrawdownSchedule schedule);

  TrailingEngine(const TrailingEngine&) = delete;
  TrailingEngine& operator=(const TrailingEngine&) = delete;

  // -------------------------------------------------------------------------
  // evaluate(position, context)
  // -------------------------------------------------------------------------
  // @return Exit with one of the reasons above, or NoAction.
  // Side-effects: may lock breakeven via PositionStore::update.
  // -------------------------------------------------------------------------
  Decision evaluate(const domain::Position& position,
                    const RuleContext& context);

  // -------------------------------------------------------------------------
  // applyTieredOffset(position)
  // -------------------------------------------------------------------------
  // @brief  Looks up the tier for the current profit and tightens the stored
  //         offset if the tier is more protective.
  // @return The offset written, std::nullopt if nothing changed.
  // -------------------------------------------------------------------------
  std::optional<double> applyTieredOffset(const domain::Position& position);

  // -------------------------------------------------------------------------
  // slOffsetFor(profit_pct)
  // -------------------------------------------------------------------------
  // @return Offset of the highest tier whose threshold ≤ profit_pct, or
  //         std::nullopt below the first tier.
  // -------------------------------------------------------------------------
  std::optional<double> slOffsetFor(double profit_pct) const;

  // Peak-drawdown check alone; returns the exit reason if it trips.
  std::optional<std::string> checkPeakDrawdown(
      const domain::Position& position) const;

  config::TrailingMode mode() const { return trailing_.mode; }

 private:
  bool lockBreakeven(const domain::Position& position);

  std::optional<std::string> checkAdaptiveUpward(
      const domain::Position& position) const;

  std::optional<std::string> checkAdaptiveDownward(
      const domain::Position& position, const RuleContext& context) const;

  PositionStore& store_;
  const config::TrailingConfig trailing_;
  const config::ReverseLossConfig reverse_loss_;
  const DrawdownSchedule schedule_;

  // Tier table sorted by threshold ascending.
  std::vector<config::TrailingTier> tiers_;
};

}  // namespace optrisk
