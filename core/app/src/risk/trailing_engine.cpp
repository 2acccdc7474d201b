#include "optrisk/risk/trailing_engine.hpp"
#include "optrisk/time/time_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <limits>
#include <utility>

namespace optrisk {

namespace {

constexpr const char* kRuleName = "TrailingRule";

std::string peakDrawdownReason(double drawdown, double peak) {
  char buffer[96];
  std::snprintf(buffer, sizeof(buffer),
                "peak_drawdown_exit (drawdown: %.2f%%, peak: %.2f%%)", drawdown,
                peak);
  return buffer;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: keep a sorted copy of the tier table
// -----------------------------------------------------------------------------
TrailingEngine::TrailingEngine(PositionStore& store,
                               config::TrailingConfig trailing,
                               config::ReverseLossConfig reverse_loss,
                               DrawdownSchedule schedule)
    : store_(store),
      trailing_(std::move(trailing)),
      reverse_loss_(std::move(reverse_loss)),
      schedule_(std::move(schedule)),
      tiers_(trailing_.tiers) {
  std::sort(tiers_.begin(), tiers_.end(),
            [](const config::TrailingTier& a, const config::TrailingTier& b) {
              return a.threshold_pct < b.threshold_pct;
            });
}

// -----------------------------------------------------------------------------
// evaluate: peak drawdown → breakeven → adaptive up → adaptive down
// -----------------------------------------------------------------------------
Decision TrailingEngine::evaluate(const domain::Position& position,
                                  const RuleContext& context) {
  if (trailing_.mode == config::TrailingMode::Tiered) {
    if (auto reason = checkPeakDrawdown(position)) {
      return Decision::exit(std::move(*reason), kRuleName);
    }
  }

  lockBreakeven(position);

  if (trailing_.mode == config::TrailingMode::Adaptive) {
    if (auto reason = checkAdaptiveUpward(position)) {
      return Decision::exit(std::move(*reason), kRuleName);
    }
  }

  if (auto reason = checkAdaptiveDownward(position, context)) {
    return Decision::exit(std::move(*reason), kRuleName);
  }

  return Decision::noAction();
}

// -----------------------------------------------------------------------------
// checkPeakDrawdown: inclusive give-back limit, optionally gated
// -----------------------------------------------------------------------------
std::optional<std::string> TrailingEngine::checkPeakDrawdown(
    const domain::Position& position) const {
  const double peak = position.peak_profit_pct;
  if (peak <= 0.0) {
    return std::nullopt;
  }

  // Rounded so 30.0 − 25.0 compares as exactly 5.0 against the threshold.
  const double drawdown = domain::roundTo(peak - position.pnl_pct, 4);
  if (drawdown < trailing_.peak_drawdown_pct) {
    return std::nullopt;
  }

  if (trailing_.gating_enabled) {
    if (peak < trailing_.activation_profit_pct) {
      return std::nullopt;
    }
    double offset = domain::currentSlOffsetPct(position)
                        .value_or(-std::numeric_limits<double>::infinity());
    if (offset < trailing_.activation_sl_offset_pct) {
      return std::nullopt;
    }
  }

  return peakDrawdownReason(drawdown, peak);
}

// -----------------------------------------------------------------------------
// lockBreakeven: once up enough, the stop never goes back below entry
// -----------------------------------------------------------------------------
bool TrailingEngine::lockBreakeven(const domain::Position& position) {
  if (trailing_.breakeven_after_gain_pct <= 0.0 || position.breakeven_locked) {
    return false;
  }
  if (position.pnl_pct < trailing_.breakeven_after_gain_pct) {
    return false;
  }

  domain::PositionUpdate update;
  update.breakeven_locked = true;
  update.sl_offset_pct = 0.0;  // ignored by the store if already tighter
  if (!store_.update(position.id, update)) {
    return false;
  }

  std::cout << "[TrailingEngine] position " << position.id
            << " breakeven locked at pnl " << position.pnl_pct << "%\n";
  return true;
}

// -----------------------------------------------------------------------------
// checkAdaptiveUpward: exponential curve, fixed-drop fallback
// -----------------------------------------------------------------------------
std::optional<std::string> TrailingEngine::checkAdaptiveUpward(
    const domain::Position& position) const {
  const double peak = position.peak_profit_pct;

  auto allowed = schedule_.allowedUpwardDrawdown(peak, position.index_key);
  if (allowed) {
    double drawdown = domain::roundTo(peak - position.pnl_pct, 4);
    if (drawdown >= *allowed) {
      return std::string("adaptive_trailing_stop");
    }
    return std::nullopt;
  }

  if (trailing_.exit_drop_pct > 0.0 && position.high_water_mark > 0.0) {
    double drop_pct = (position.high_water_mark - position.pnl) /
                      position.high_water_mark * 100.0;
    if (domain::roundTo(drop_pct, 4) >= trailing_.exit_drop_pct) {
      return std::string("trailing_stop_fixed");
    }
  }

  return std::nullopt;
}

// -----------------------------------------------------------------------------
// checkAdaptiveDownward: loss tolerance shrinks with depth, time, quiet markets
// -----------------------------------------------------------------------------
std::optional<std::string> TrailingEngine::checkAdaptiveDownward(
    const domain::Position& position, const RuleContext& context) const {
  if (!reverse_loss_.enabled || !(position.pnl < 0.0)) {
    return std::nullopt;
  }

  const double loss_pct = -position.pnl_pct;

  double seconds_underwater = 0.0;
  if (position.underwater_since_ms) {
    seconds_underwater =
        seconds_between(*position.underwater_since_ms, context.now_ms);
  }

  double volatility_ratio = 1.0;
  if (context.underlying != nullptr && position.underlying) {
    if (auto state = context.underlying->latest(*position.underlying)) {
      volatility_ratio = state->volatility_ratio.value_or(1.0);
    }
  }

  double allowed = schedule_.allowedDownwardLoss(loss_pct, seconds_underwater,
                                                 volatility_ratio);
  if (loss_pct >= allowed) {
    return std::string("adaptive_stop_loss");
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// slOffsetFor: highest tier reached by profit_pct
// -----------------------------------------------------------------------------
std::optional<double> TrailingEngine::slOffsetFor(double profit_pct) const {
  for (auto it = tiers_.rbegin(); it != tiers_.rend(); ++it) {
    if (profit_pct >= it->threshold_pct) {
      return it->sl_offset_pct;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// applyTieredOffset: tighten-only write of the tier offset
// -----------------------------------------------------------------------------
std::optional<double> TrailingEngine::applyTieredOffset(
    const domain::Position& position) {
  auto desired = slOffsetFor(position.pnl_pct);
  if (!desired) {
    return std::nullopt;
  }
  if (position.sl_offset_pct && *desired <= *position.sl_offset_pct) {
    return std::nullopt;
  }

  domain::PositionUpdate update;
  update.sl_offset_pct = *desired;
  if (!store_.update(position.id, update)) {
    return std::nullopt;
  }

  std::cout << "[TrailingEngine] position " << position.id
            << " sl_offset -> " << *desired << "% (pnl " << position.pnl_pct
            << "%)\n";
  return desired;
}

}  // namespace optrisk
