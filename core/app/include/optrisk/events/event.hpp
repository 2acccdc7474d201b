#pragma once

#include "optrisk/events/event_types.hpp"
#include "optrisk/events/position_events.hpp"

#include <variant>

namespace optrisk {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope type carried by every EventBus and queue in the engine.
//
// Two families travel through it:
//   - market input (TickEvent, UnderlyingStateEvent) on the tick bus, published
//     synchronously by the market data thread;
//   - lifecycle notifications (PositionOpenedEvent, ExitNotificationEvent,
//     ExitFailedEvent) on the notification loop.
//
// std::variant keeps events as values: no heap allocation, no base-class
// pointers, and subscribers dispatch with std::get_if.
// -----------------------------------------------------------------------------
using Event = std::variant<
    TickEvent,
    UnderlyingStateEvent,
    PositionOpenedEvent,
    ExitNotificationEvent,
    ExitFailedEvent>;

}  // namespace optrisk
