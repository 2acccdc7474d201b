#pragma once

#include "optrisk/domain/instrument_key.hpp"
#include "optrisk/domain/underlying_state.hpp"

#include <cstdint>

namespace optrisk {

// -----------------------------------------------------------------------------
// TickEvent
// -----------------------------------------------------------------------------
// Responsibility: One normalized last-traded-price update from the broker
// feed. The market data thread publishes these on the tick bus; PositionStore
// and LtpCache subscribe.
//
// timestamp_ms is the exchange timestamp carried by the feed (epoch ms). It is
// 0 when the feed omitted it, in which case consumers fall back to their clock.
// -----------------------------------------------------------------------------
struct TickEvent {
  domain::InstrumentKey instrument;
  double last_price{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// UnderlyingStateEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries an indicator-layer snapshot of an underlying index
// into UnderlyingStateStore. Arrives on the same feed as ticks.
// -----------------------------------------------------------------------------
struct UnderlyingStateEvent {
  domain::UnderlyingState state;
};

}  // namespace optrisk
