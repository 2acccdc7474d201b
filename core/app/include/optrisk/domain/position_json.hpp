#pragma once

#include "optrisk/domain/position.hpp"

#include <nlohmann/json.hpp>

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// Position ⇄ JSON
// -----------------------------------------------------------------------------
//
// One JSON shape is shared by the IPC ADD command, the positions file read at
// startup and the STATUS / SNAPSHOT replies:
//
//   {
//     "id": 7,                          // reconciler / replies only
//     "segment": "NSE_FNO", "security_id": "43210",   // id may be an int
//     "index_key": "NIFTY",
//     "side": "BUY" | "SELL",
//     "direction": "bullish" | "bearish",
//     "entry_price": 100.0, "quantity": 75,
//     "sl_price", "tp_price", "sl_pct", "tp_pct",
//     "max_loss_rupees", "target_profit_rupees",      // all optional
//     "underlying": {"segment": "IDX_I", "security_id": "13"},
//     "opened_at_ms", "peak_profit_pct", "high_water_mark",
//     "sl_offset_pct", "breakeven_locked"             // reconciler only
//   }
//
// Parsers throw std::invalid_argument with the offending key in the message;
// nlohmann type errors are converted, never leaked.
// -----------------------------------------------------------------------------

PositionRequest positionRequestFromJson(const nlohmann::json& j);

// Full position including persisted trailing state. Requires "id".
Position positionFromJson(const nlohmann::json& j);

nlohmann::json positionToJson(const Position& position);

InstrumentKey instrumentKeyFromJson(const nlohmann::json& j);

const char* sideToString(Side side);
const char* directionToString(Direction direction);
const char* statusToString(PositionStatus status);

}  // namespace domain
}  // namespace optrisk
