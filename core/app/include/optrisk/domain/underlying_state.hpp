#pragma once

#include "optrisk/domain/instrument_key.hpp"

#include <cstdint>
#include <optional>

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// Direction
// -----------------------------------------------------------------------------
// Market direction. Used both for the position's thesis (a long call is
// Bullish, a long put is Bearish) and for the direction in which the
// underlying's structure broke.
// -----------------------------------------------------------------------------
enum class Direction {
  Neutral,
  Bullish,
  Bearish,
};

enum class StructureState {
  Unknown,
  Intact,
  Broken,
};

enum class VolatilityTrend {
  Unknown,
  Falling,
  Flat,
  Rising,
};

// -----------------------------------------------------------------------------
// UnderlyingState: point-in-time health snapshot of an underlying index
// -----------------------------------------------------------------------------
//
// @brief  What the underlying-aware exit rule needs to know about the index
//         an option leg is written on.
//
// @details
// Produced outside this engine by the indicator layer and delivered on the
// market data feed as "underlying_state" messages. UnderlyingStateStore keeps
// the latest one per underlying and refuses to serve it once it is older than
// the configured staleness bound.
//
//   trend_score         0..21 composite trend strength; absent if unknown
//   structure_state     whether the last swing structure is intact or broken
//   structure_direction direction of the break (only meaningful when Broken)
//   volatility_trend    ATR trend classification
//   volatility_ratio    current ATR / previous ATR; absent if unknown
//
// Plain value type; copied out of the store on every read.
// -----------------------------------------------------------------------------
struct UnderlyingState {
  InstrumentKey underlying;
  std::optional<double> trend_score;
  StructureState structure_state{StructureState::Unknown};
  Direction structure_direction{Direction::Neutral};
  VolatilityTrend volatility_trend{VolatilityTrend::Unknown};
  std::optional<double> volatility_ratio;
  std::int64_t observed_at_ms{0};
};

}  // namespace domain
}  // namespace optrisk
