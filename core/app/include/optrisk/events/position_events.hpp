#pragma once

#include "optrisk/domain/position.hpp"

#include <cstdint>
#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// PositionOpenedEvent: a fill was registered and is now under management
// -----------------------------------------------------------------------------
// Published by RiskManager::addPosition() and for every hydrated position.
// -----------------------------------------------------------------------------
struct PositionOpenedEvent {
  domain::Position position;
  bool hydrated{false};  // true when restored by the reconciler at startup
};

// -----------------------------------------------------------------------------
// ExitNotificationEvent: a position was closed exactly once
// -----------------------------------------------------------------------------
//
// @brief  Emitted by ExitCoordinator after the order router confirmed the
//         exit and the record was marked closed.
//
// @details
// `position` is the last snapshot taken under the record lock, with
// status == Closed. pnl / pnl_pct are recomputed at exit_price so they
// match what was actually realized, which can differ from the last tick.
//
// Thread model:
//   Created on the sweep thread (or the IPC thread for manual exits) and
//   pushed into the notification loop's queue. Subscribers run on the
//   notification loop thread.
// -----------------------------------------------------------------------------
struct ExitNotificationEvent {
  domain::Position position;
  std::string reason;
  double exit_price{0.0};
  double pnl{0.0};
  double pnl_pct{0.0};
  double peak_profit_pct{0.0};
  std::int64_t exited_at_ms{0};
};

// -----------------------------------------------------------------------------
// ExitFailedEvent: the order router refused or threw; position stays Open
// -----------------------------------------------------------------------------
struct ExitFailedEvent {
  domain::PositionId position_id{0};
  domain::InstrumentKey instrument;
  std::string reason;  // exit reason that was being attempted
  std::string error;   // router error message
  std::int64_t failed_at_ms{0};
};

}  // namespace optrisk
