// =============================================================================
// exit_coordinator_test.cpp
// =============================================================================
// Unit tests for optrisk::ExitCoordinator.
//
// Validates:
//   - A successful exit closes the record, removes the position, notifies once
//   - A second exit of the same position is a no-op (already_closed)
//   - Unknown ids report already_closed without touching the router
//   - Eight threads racing to exit one position place exactly one order
//   - Router failure or exception leaves the position Open, emits ExitFailed
//   - Exit price falls back from LTP to the price cache to the entry price
//   - Purging closed records keeps open ones; a late exit stays a no-op
//   - A throwing notification sink does not undo the exit
//   - The paper router fills a never-ticked position at its entry price
// =============================================================================

#include "optrisk/eventbus/event_bus.hpp"
#include "optrisk/execution/paper_order_router.hpp"
#include "optrisk/risk/exit_coordinator.hpp"
#include "optrisk/risk/in_memory_position_record.hpp"
#include "optrisk/risk/ltp_cache.hpp"
#include "optrisk/risk/position_store.hpp"
#include "optrisk/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

// Router double: counts calls, can fail, throw, or stall to widen races.
class FakeRouter final : public optrisk::IOrderRouter {
 public:
  enum class Mode { Fill, Reject, Throw };

  optrisk::ExitOrderResult exitMarket(
      const optrisk::domain::Position& position,
      double reference_price) override {
    ++calls;
    last_reference_price = reference_price;
    if (stall_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(stall_ms));
    }
    optrisk::ExitOrderResult r;
    switch (mode) {
      case Mode::Throw:
        throw std::runtime_error("broker connection reset");
      case Mode::Reject:
        r.success = false;
        r.error = "rejected by broker";
        return r;
      case Mode::Fill:
        break;
    }
    r.success = true;
    r.fill_price = fill_price;
    last_position = position;
    return r;
  }

  Mode mode{Mode::Fill};
  std::optional<double> fill_price;
  int stall_ms{0};
  std::atomic<int> calls{0};
  optrisk::domain::Position last_position;
  double last_reference_price{0.0};
};

}  // namespace

class ExitCoordinatorTest : public ::testing::Test {
 protected:
  ExitCoordinatorTest()
      : coordinator(store, records, cache, router, clock,
                    [this](optrisk::Event e) {
                      std::lock_guard lock(events_mutex);
                      events.push_back(std::move(e));
                    }) {}

  void open(optrisk::domain::PositionId id, const std::string& security_id) {
    optrisk::domain::Position p;
    p.id = id;
    p.instrument = {"NSE_FNO", security_id};
    p.entry_price = 100.0;
    p.quantity = 50.0;
    records.create(id);
    store.add(p);
  }

  void tick(optrisk::EventBus& target, const std::string& security_id,
            double price) {
    optrisk::TickEvent e;
    e.instrument = {"NSE_FNO", security_id};
    e.last_price = price;
    target.publish(e);
  }

  template <typename T>
  std::vector<T> eventsOf() {
    std::lock_guard lock(events_mutex);
    std::vector<T> out;
    for (const auto& e : events) {
      if (const auto* v = std::get_if<T>(&e)) {
        out.push_back(*v);
      }
    }
    return out;
  }

  optrisk::EventBus store_bus;
  optrisk::EventBus cache_bus;  // separate, so the cache can know a price
                                // the store never saw
  optrisk::SimulationTimeProvider clock{1'705'293'000'000};
  optrisk::PositionStore store{store_bus, clock};
  optrisk::LtpCache cache{cache_bus};
  optrisk::InMemoryPositionRecordRepository records;
  FakeRouter router;

  std::mutex events_mutex;
  std::vector<optrisk::Event> events;

  optrisk::ExitCoordinator coordinator;
};

// -----------------------------------------------------------------------------
// 1. Successful exit at the LTP.
// -----------------------------------------------------------------------------
TEST_F(ExitCoordinatorTest, ClosesRemovesAndNotifies) {
  open(1, "100");
  tick(store_bus, "100", 120.0);

  auto result = coordinator.executeExit(1, "take_profit_hit");
  EXPECT_TRUE(result.closed);
  EXPECT_FALSE(result.already_closed);
  EXPECT_DOUBLE_EQ(result.exit_price, 120.0);

  EXPECT_FALSE(store.snapshot(1).has_value());
  auto record = records.find(1);
  ASSERT_NE(record, nullptr);
  EXPECT_TRUE(record->closed());
  EXPECT_DOUBLE_EQ(*record->exitPrice(), 120.0);
  EXPECT_EQ(*record->exitReason(), "take_profit_hit");

  EXPECT_EQ(router.last_position.id, 1u);

  auto exits = eventsOf<optrisk::ExitNotificationEvent>();
  ASSERT_EQ(exits.size(), 1u);
  EXPECT_EQ(exits[0].reason, "take_profit_hit");
  EXPECT_DOUBLE_EQ(exits[0].pnl, 1000.0);
  EXPECT_DOUBLE_EQ(exits[0].pnl_pct, 20.0);
  EXPECT_DOUBLE_EQ(exits[0].peak_profit_pct, 20.0);
  EXPECT_EQ(exits[0].position.status, optrisk::domain::PositionStatus::Closed);
  EXPECT_EQ(coordinator.exitsExecuted(), 1u);
}

// -----------------------------------------------------------------------------
// 2. The router's fill price wins over the LTP.
// -----------------------------------------------------------------------------
TEST_F(ExitCoordinatorTest, FillPriceOverridesLtp) {
  router.fill_price = 118.5;
  open(1, "100");
  tick(store_bus, "100", 120.0);

  auto result = coordinator.executeExit(1, "manual_exit");
  EXPECT_DOUBLE_EQ(result.exit_price, 118.5);
  EXPECT_DOUBLE_EQ(*records.find(1)->exitPrice(), 118.5);
}

// -----------------------------------------------------------------------------
// 3. Exiting twice: the second call is a no-op.
// -----------------------------------------------------------------------------
TEST_F(ExitCoordinatorTest, SecondExitIsNoOp) {
  open(1, "100");
  tick(store_bus, "100", 120.0);

  ASSERT_TRUE(coordinator.executeExit(1, "stop_loss_hit").closed);
  auto again = coordinator.executeExit(1, "manual_exit");
  EXPECT_FALSE(again.closed);
  EXPECT_TRUE(again.already_closed);

  EXPECT_EQ(router.calls.load(), 1);
  EXPECT_EQ(eventsOf<optrisk::ExitNotificationEvent>().size(), 1u);
  EXPECT_EQ(*records.find(1)->exitReason(), "stop_loss_hit");
}

// -----------------------------------------------------------------------------
// 4. Unknown id.
// -----------------------------------------------------------------------------
TEST_F(ExitCoordinatorTest, UnknownIdIsAlreadyClosed) {
  auto result = coordinator.executeExit(404, "manual_exit");
  EXPECT_TRUE(result.already_closed);
  EXPECT_EQ(router.calls.load(), 0);
  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 5. Eight threads race to exit one position.
// Why: Sweep and manual IPC exits can collide. Only one order may ever be
//      sent for a position.
// -----------------------------------------------------------------------------
TEST_F(ExitCoordinatorTest, ConcurrentExitsPlaceOneOrder) {
  router.stall_ms = 20;
  open(1, "100");
  tick(store_bus, "100", 110.0);

  std::atomic<int> closed{0};
  std::atomic<int> already{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      auto r = coordinator.executeExit(1, "session_end_exit");
      if (r.closed) ++closed;
      if (r.already_closed) ++already;
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(router.calls.load(), 1);
  EXPECT_EQ(closed.load(), 1);
  EXPECT_EQ(already.load(), 7);
  EXPECT_EQ(eventsOf<optrisk::ExitNotificationEvent>().size(), 1u);
}

// -----------------------------------------------------------------------------
// 6. A rejected order leaves the position Open and reports the failure.
// -----------------------------------------------------------------------------
TEST_F(ExitCoordinatorTest, RejectedOrderKeepsPositionOpen) {
  router.mode = FakeRouter::Mode::Reject;
  open(1, "100");
  tick(store_bus, "100", 90.0);

  auto result = coordinator.executeExit(1, "stop_loss_hit");
  EXPECT_FALSE(result.closed);
  EXPECT_FALSE(result.already_closed);
  EXPECT_EQ(result.error, "rejected by broker");

  auto snap = store.snapshot(1);
  ASSERT_TRUE(snap.has_value());
  EXPECT_EQ(snap->status, optrisk::domain::PositionStatus::Open);
  EXPECT_FALSE(records.find(1)->closed());

  auto failures = eventsOf<optrisk::ExitFailedEvent>();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].position_id, 1u);
  EXPECT_EQ(failures[0].reason, "stop_loss_hit");
  EXPECT_EQ(coordinator.exitsFailed(), 1u);

  // The next attempt may succeed.
  router.mode = FakeRouter::Mode::Fill;
  EXPECT_TRUE(coordinator.executeExit(1, "stop_loss_hit").closed);
}

// -----------------------------------------------------------------------------
// 7. A router exception is treated like a rejection.
// -----------------------------------------------------------------------------
TEST_F(ExitCoordinatorTest, RouterExceptionKeepsPositionOpen) {
  router.mode = FakeRouter::Mode::Throw;
  open(1, "100");
  tick(store_bus, "100", 90.0);

  auto result = coordinator.executeExit(1, "stop_loss_hit");
  EXPECT_FALSE(result.closed);
  EXPECT_EQ(result.error, "broker connection reset");
  EXPECT_EQ(store.snapshot(1)->status, optrisk::domain::PositionStatus::Open);
  EXPECT_EQ(eventsOf<optrisk::ExitFailedEvent>().size(), 1u);
}

// -----------------------------------------------------------------------------
// 8. No tick on the position: price from the cache, else the entry price.
// -----------------------------------------------------------------------------
TEST_F(ExitCoordinatorTest, ExitPriceFallbacks) {
  open(1, "100");
  open(2, "200");
  tick(cache_bus, "100", 97.0);

  EXPECT_DOUBLE_EQ(coordinator.executeExit(1, "session_end_exit").exit_price,
                   97.0);
  EXPECT_DOUBLE_EQ(router.last_reference_price, 97.0);
  EXPECT_DOUBLE_EQ(coordinator.executeExit(2, "session_end_exit").exit_price,
                   100.0);
  EXPECT_DOUBLE_EQ(router.last_reference_price, 100.0);

  auto exits = eventsOf<optrisk::ExitNotificationEvent>();
  ASSERT_EQ(exits.size(), 2u);
  EXPECT_DOUBLE_EQ(exits[1].pnl, 0.0);
}

// -----------------------------------------------------------------------------
// 9. Releasing closed records keeps open ones and stays idempotent.
// Why: The repository is per session; a late duplicate exit after the purge
//      must still be a no-op rather than a second order.
// -----------------------------------------------------------------------------
TEST_F(ExitCoordinatorTest, PurgeClosedKeepsOpenRecords) {
  open(1, "100");
  open(2, "200");
  tick(store_bus, "100", 120.0);
  ASSERT_TRUE(coordinator.executeExit(1, "take_profit_hit").closed);

  EXPECT_EQ(records.purgeClosed(), 1u);
  EXPECT_EQ(records.size(), 1u);
  EXPECT_EQ(records.find(1), nullptr);
  ASSERT_NE(records.find(2), nullptr);
  EXPECT_FALSE(records.find(2)->closed());
  EXPECT_TRUE(records.closedRecords().empty());

  auto late = coordinator.executeExit(1, "manual_exit");
  EXPECT_TRUE(late.already_closed);
  EXPECT_EQ(router.calls.load(), 1);
  EXPECT_EQ(records.purgeClosed(), 0u);
}

// -----------------------------------------------------------------------------
// 10. A sink that throws does not undo the exit.
// -----------------------------------------------------------------------------
TEST(ExitCoordinatorSinkTest, ThrowingSinkDoesNotUndoExit) {
  optrisk::EventBus bus;
  optrisk::SimulationTimeProvider clock{1'000};
  optrisk::PositionStore store(bus, clock);
  optrisk::LtpCache cache(bus);
  optrisk::InMemoryPositionRecordRepository records;
  FakeRouter router;
  optrisk::ExitCoordinator coordinator(
      store, records, cache, router, clock, [](optrisk::Event) {
        throw std::runtime_error("subscriber down");
      });

  optrisk::domain::Position p;
  p.id = 3;
  p.instrument = {"NSE_FNO", "300"};
  p.entry_price = 50.0;
  p.quantity = 25.0;
  records.create(3);
  store.add(p);

  auto result = coordinator.executeExit(3, "manual_exit");
  EXPECT_TRUE(result.closed);
  EXPECT_TRUE(records.find(3)->closed());
  EXPECT_EQ(store.size(), 0u);
}

// -----------------------------------------------------------------------------
// 11. Paper routing of a position that never ticked.
// Why: Without a market price the paper fill must use the resolved entry
//      price; otherwise the position could never close and every sweep would
//      retry the same failing order.
// -----------------------------------------------------------------------------
TEST(ExitCoordinatorPaperTest, UntickedPositionClosesAtEntry) {
  optrisk::EventBus bus;
  optrisk::SimulationTimeProvider clock{1'000};
  optrisk::PositionStore store(bus, clock);
  optrisk::LtpCache cache(bus);
  optrisk::InMemoryPositionRecordRepository records;
  optrisk::PaperOrderRouter router;
  optrisk::ExitCoordinator coordinator(store, records, cache, router, clock,
                                       nullptr);

  optrisk::domain::Position p;
  p.id = 1;
  p.instrument = {"NSE_FNO", "123"};
  p.entry_price = 80.0;
  p.quantity = 75.0;
  records.create(1);
  store.add(p);

  auto first = coordinator.executeExit(1, "session_end_exit");
  EXPECT_TRUE(first.closed);
  EXPECT_TRUE(first.error.empty());
  EXPECT_DOUBLE_EQ(first.exit_price, 80.0);
  EXPECT_EQ(store.size(), 0u);
  EXPECT_DOUBLE_EQ(*records.find(1)->exitPrice(), 80.0);

  for (int i = 0; i < 2; ++i) {
    auto again = coordinator.executeExit(1, "session_end_exit");
    EXPECT_FALSE(again.closed);
    EXPECT_TRUE(again.already_closed);
  }
  EXPECT_EQ(coordinator.exitsFailed(), 0u);
  EXPECT_EQ(coordinator.exitsExecuted(), 1u);
}
