#include "optrisk/risk/exit_coordinator.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <utility>

namespace optrisk {

ExitCoordinator::ExitCoordinator(PositionStore& store,
                                 IPositionRecordRepository& records,
                                 const ILastPriceSource& prices,
                                 IOrderRouter& router,
                                 const ITimeProvider& clock,
                                 NotificationSink sink)
    : store_(store),
      records_(records),
      prices_(prices),
      router_(router),
      clock_(clock),
      sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// executeExit: check-then-act under the record lock
// -----------------------------------------------------------------------------
ExitResult ExitCoordinator::executeExit(domain::PositionId id,
                                        const std::string& reason) {
  ExitResult result;

  auto record = records_.find(id);
  if (!record) {
    result.already_closed = true;
    return result;
  }

  std::optional<Event> notification;

  record->withExclusiveLock([&] {
    if (record->closed()) {
      result.already_closed = true;
      return;
    }

    auto snapshot = store_.snapshot(id);
    if (!snapshot) {
      std::cerr << "[ExitCoordinator] Position " << id
                << " has an open record but is not in the store\n";
      result.already_closed = true;
      return;
    }

    domain::PositionUpdate exiting;
    exiting.status = domain::PositionStatus::Exiting;
    store_.update(id, exiting);

    double resolved_price = resolveExitPrice(*snapshot);

    ExitOrderResult order;
    try {
      order = router_.exitMarket(*snapshot, resolved_price);
    } catch (const std::exception& e) {
      order.success = false;
      order.error = e.what();
    }

    if (!order.success) {
      domain::PositionUpdate reopen;
      reopen.status = domain::PositionStatus::Open;
      store_.update(id, reopen);

      ++exits_failed_;
      std::cerr << "[ExitCoordinator] Exit order failed for position " << id
                << " (" << reason << "): " << order.error << "\n";

      ExitFailedEvent failed;
      failed.position_id = id;
      failed.instrument = snapshot->instrument;
      failed.reason = reason;
      failed.error = order.error;
      failed.failed_at_ms = clock_.now_ms();
      notification = Event{std::move(failed)};

      result.error = order.error;
      return;
    }

    double exit_price = order.fill_price.value_or(resolved_price);
    record->markClosed(exit_price, reason);
    store_.remove(id);
    ++exits_executed_;

    domain::Position closed = *snapshot;
    closed.status = domain::PositionStatus::Closed;
    closed.ltp = exit_price;

    ExitNotificationEvent exit;
    exit.reason = reason;
    exit.exit_price = exit_price;
    exit.pnl = (exit_price - closed.entry_price) * closed.quantity *
               domain::sideSign(closed.side);
    exit.pnl_pct = domain::roundTo(domain::pnlPctAtPrice(closed, exit_price), 4);
    exit.peak_profit_pct = closed.peak_profit_pct;
    exit.exited_at_ms = clock_.now_ms();
    closed.pnl = exit.pnl;
    closed.pnl_pct = exit.pnl_pct;
    exit.position = std::move(closed);

    std::cout << "[ExitCoordinator] Closed position " << id << " at "
              << exit_price << " reason=" << reason
              << " pnl_pct=" << exit.pnl_pct << "\n";

    notification = Event{std::move(exit)};
    result.closed = true;
    result.exit_price = exit_price;
  });

  if (notification) {
    notify(std::move(*notification));
  }
  return result;
}

// -----------------------------------------------------------------------------
// resolveExitPrice: store LTP → cache → entry
// -----------------------------------------------------------------------------
double ExitCoordinator::resolveExitPrice(
    const domain::Position& position) const {
  if (position.ltp > 0.0) {
    return position.ltp;
  }

  auto cached = prices_.lastPrice(position.instrument);
  if (cached && *cached > 0.0) {
    return *cached;
  }

  std::cerr << "[ExitCoordinator] No price for "
            << position.instrument.composite() << " (position " << position.id
            << "), falling back to entry " << position.entry_price << "\n";
  return position.entry_price;
}

void ExitCoordinator::notify(Event event) {
  if (!sink_) {
    return;
  }
  try {
    sink_(std::move(event));
  } catch (const std::exception& e) {
    std::cerr << "[ExitCoordinator] Notification sink failed: " << e.what()
              << "\n";
  }
}

}  // namespace optrisk
