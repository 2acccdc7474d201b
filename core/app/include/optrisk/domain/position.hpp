#pragma once

#include "optrisk/domain/instrument_key.hpp"
#include "optrisk/domain/underlying_state.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// PositionId
// -----------------------------------------------------------------------------
// Unique identifier of a managed position. Assigned by RiskManager from a
// monotonically increasing generator when the fill is registered. The same id
// keys the position's IPositionRecord, so it doubles as the owning record
// reference.
// -----------------------------------------------------------------------------
using PositionId = std::uint64_t;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Buy = long premium (the usual case for an options-buying bot), Sell = short
// premium. PnL sign and price-threshold conversion depend on it.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// PositionStatus
// -----------------------------------------------------------------------------
// Open    → evaluated by every sweep.
// Exiting → ExitCoordinator holds the record lock and an exit order is in
//           flight; sweeps skip it.
// Closed  → terminal. Closed positions are removed from PositionStore, so the
//           store itself never holds one; the status exists for snapshots
//           taken by the coordinator after a successful exit.
// -----------------------------------------------------------------------------
enum class PositionStatus {
  Open,
  Exiting,
  Closed,
};

// -----------------------------------------------------------------------------
// ExitThresholds: static and rupee-based exit levels
// -----------------------------------------------------------------------------
//
// @brief  The static stop-loss / take-profit levels attached to a position at
//         entry, either as absolute option prices or as percentages of the
//         entry price, plus optional rupee-denominated hard limits.
//
// @details
// Percent fields are magnitudes: sl_pct = 30 means "exit at −30%",
// tp_pct = 60 means "exit at +60%". When both a price and a percent are
// given for the same side, the more protective of the two wins (see
// stopLossPnlPct / takeProfitPnlPct below).
//
// max_loss_rupees / target_profit_rupees are account-protection circuit
// breakers evaluated on absolute PnL, independent of percentages.
// -----------------------------------------------------------------------------
struct ExitThresholds {
  std::optional<double> sl_price;
  std::optional<double> tp_price;
  std::optional<double> sl_pct;
  std::optional<double> tp_pct;
  std::optional<double> max_loss_rupees;
  std::optional<double> target_profit_rupees;
};

// -----------------------------------------------------------------------------
// Position: one open options leg under management
// -----------------------------------------------------------------------------
//
// @brief  Authoritative state of a position while it is owned by
//         PositionStore. Everything outside the store sees copies.
//
// @details
// Market state is refreshed on every tick by PositionStore::onTick():
//
//   pnl      = (ltp − entry) × quantity × sign
//   pnl_pct  = (ltp − entry) / entry × 100 × sign      (rounded to 4 dp)
//   sign     = +1 for Side::Buy, −1 for Side::Sell
//
// high_water_mark and peak_profit_pct are maxima over the position's
// lifetime: they only move up, even when ticks arrive out of order.
//
// sl_offset_pct is the trailing stop expressed as a pnl percentage relative to
// entry (−15 means "stop at −15%", +10 means "stop locks in +10%"). It is
// absent until the first tier is reached and only ever tightens.
//
// underwater_since_ms is set by the first tick that takes PnL below zero and
// cleared by the first tick that brings it back to zero or above.
//
// Value type. PositionStore mutates its own copy under a shard lock; rules,
// snapshots and notifications receive copies.
// -----------------------------------------------------------------------------
struct Position {
  PositionId id{0};
  InstrumentKey instrument;
  std::string index_key;                 // Instrument class (e.g. "NIFTY")
  Side side{Side::Buy};
  Direction direction{Direction::Bullish};

  double entry_price{0.0};
  double quantity{0.0};
  double ltp{0.0};                       // 0 until the first tick arrives
  std::int64_t opened_at_ms{0};
  std::int64_t last_update_ms{0};

  double pnl{0.0};
  double pnl_pct{0.0};
  double high_water_mark{0.0};
  double peak_profit_pct{0.0};
  std::optional<std::int64_t> underwater_since_ms;

  ExitThresholds thresholds;
  std::optional<double> sl_offset_pct;
  bool breakeven_locked{false};

  std::optional<InstrumentKey> underlying;

  PositionStatus status{PositionStatus::Open};
};

// -----------------------------------------------------------------------------
// PositionUpdate: derived-field mutation request for PositionStore::update
// -----------------------------------------------------------------------------
// Every field is optional; absent fields are left untouched. The store
// enforces the invariants: sl_offset_pct is applied only if it is more
// protective than the stored offset, and peak_profit_pct is max-merged.
// -----------------------------------------------------------------------------
struct PositionUpdate {
  std::optional<double> sl_offset_pct;
  std::optional<bool> breakeven_locked;
  std::optional<PositionStatus> status;
  std::optional<double> peak_profit_pct;
};

// -----------------------------------------------------------------------------
// PositionRequest: a confirmed fill handed to RiskManager::addPosition
// -----------------------------------------------------------------------------
struct PositionRequest {
  InstrumentKey instrument;
  std::string index_key;
  Side side{Side::Buy};
  Direction direction{Direction::Bullish};
  double entry_price{0.0};
  double quantity{0.0};
  ExitThresholds thresholds;
  std::optional<InstrumentKey> underlying;
};

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

inline double sideSign(Side side) { return side == Side::Buy ? 1.0 : -1.0; }

inline double roundTo(double value, int decimals) {
  double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

// PnL percent the position would show if the option traded at `price`.
inline double pnlPctAtPrice(const Position& pos, double price) {
  return (price - pos.entry_price) / pos.entry_price * 100.0 * sideSign(pos.side);
}

// Static stop-loss level as a (negative) pnl percent. Combines the price and
// percent forms, taking the more protective (higher) one.
inline std::optional<double> stopLossPnlPct(const Position& pos) {
  std::optional<double> level;
  if (pos.thresholds.sl_pct) {
    level = -std::abs(*pos.thresholds.sl_pct);
  }
  if (pos.thresholds.sl_price && pos.entry_price > 0.0) {
    double from_price = pnlPctAtPrice(pos, *pos.thresholds.sl_price);
    level = level ? std::max(*level, from_price) : from_price;
  }
  return level;
}

// Static take-profit level as a (positive) pnl percent. The nearer of the
// price and percent forms wins.
inline std::optional<double> takeProfitPnlPct(const Position& pos) {
  std::optional<double> level;
  if (pos.thresholds.tp_pct) {
    level = std::abs(*pos.thresholds.tp_pct);
  }
  if (pos.thresholds.tp_price && pos.entry_price > 0.0) {
    double from_price = pnlPctAtPrice(pos, *pos.thresholds.tp_price);
    level = level ? std::min(*level, from_price) : from_price;
  }
  return level;
}

// Current trailing stop offset, falling back to the static stop when no
// trailing offset has been set yet.
inline std::optional<double> currentSlOffsetPct(const Position& pos) {
  if (pos.sl_offset_pct) {
    return pos.sl_offset_pct;
  }
  return stopLossPnlPct(pos);
}

}  // namespace domain
}  // namespace optrisk
