#pragma once

#include "optrisk/domain/position.hpp"
#include "optrisk/events/event.hpp"
#include "optrisk/execution/i_order_router.hpp"
#include "optrisk/risk/i_position_record.hpp"
#include "optrisk/risk/ltp_cache.hpp"
#include "optrisk/risk/position_store.hpp"
#include "optrisk/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// ExitResult
// -----------------------------------------------------------------------------
// closed          this call closed the position.
// already_closed  someone else closed it first, or the id is unknown. No side
//                 effects were produced.
// exit_price      recorded exit price when closed.
// error           router error when the exit was attempted and failed.
// -----------------------------------------------------------------------------
struct ExitResult {
  bool closed{false};
  bool already_closed{false};
  double exit_price{0.0};
  std::string error;
};

// -----------------------------------------------------------------------------
// ExitCoordinator: the one way a position goes from Open to Closed
// -----------------------------------------------------------------------------
//
// @brief  Idempotent exit execution. Sweep exits and manual exits both come
//         through executeExit(), so a position produces at most one exit order
//         no matter how many callers race for it.
//
// @details
// Under the record's exclusive lock:
//
//   1. closed()? → {already_closed}
//   2. store status → Exiting (sweeps skip it from now on)
//   3. exit price  = store ltp, else LtpCache, else entry price (logged)
//   4. router.exitMarket(position, exit price)
//        success → record.markClosed(fill or resolved price, reason)
//                  store.remove(id)
//                  ExitNotificationEvent
//        failure → store status → Open, ExitFailedEvent
//
// Notifications go to the sink after the record lock is released. An
// exception thrown by the sink is logged; the exit itself already happened.
//
// Thread model:
//   executeExit() is called from the sweep thread and from the IPC thread.
//   Concurrent calls for the same id serialize on the record lock; calls for
//   different ids do not contend.
//
// Ownership:
//   Borrows every collaborator. RiskManager owns them and destroys the
//   coordinator first.
// -----------------------------------------------------------------------------
class ExitCoordinator {
 public:
  using NotificationSink = std::function<void(Event)>;

  ExitCoordinator(PositionStore& store, IPositionRecordRepository& records,
                  const ILastPriceSource& prices, IOrderRouter& router,
                  const ITimeProvider& clock, NotificationSink sink);

  ExitCoordinator(const ExitCoordinator&) = delete;
  ExitCoordinator& operator=(const ExitCoordinator&) = delete;

  // -------------------------------------------------------------------------
  // executeExit(id, reason)
  // -------------------------------------------------------------------------
  // @param  id      Position to close.
  // @param  reason  Terminal exit reason recorded on the record.
  // @return See ExitResult. Never throws for router or sink failures.
  // -------------------------------------------------------------------------
  ExitResult executeExit(domain::PositionId id, const std::string& reason);

  std::uint64_t exitsExecuted() const { return exits_executed_.load(); }
  std::uint64_t exitsFailed() const { return exits_failed_.load(); }

 private:
  double resolveExitPrice(const domain::Position& position) const;
  void notify(Event event);

  PositionStore& store_;
  IPositionRecordRepository& records_;
  const ILastPriceSource& prices_;
  IOrderRouter& router_;
  const ITimeProvider& clock_;
  NotificationSink sink_;

  std::atomic<std::uint64_t> exits_executed_{0};
  std::atomic<std::uint64_t> exits_failed_{0};
};

}  // namespace optrisk
