// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for optrisk::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event
//   - Unsubscribe correctly stops delivery
//   - Edge cases: unsubscribe unknown id, publish to empty bus
//   - Re-entrant publish (subscriber publishes inside callback): no deadlock
//   - A throwing subscriber does not stop delivery to the others
//
// Design note: All tests are single-threaded (testing EventBus in isolation).
// Cross-thread delivery is covered in event_loop_thread_test.cpp.
// =============================================================================

#include "optrisk/eventbus/event_bus.hpp"
#include "optrisk/events/event.hpp"
#include "optrisk/events/event_types.hpp"
#include "optrisk/events/position_events.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

// =============================================================================
// Test fixture: provides a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  optrisk::EventBus bus;

  static optrisk::TickEvent makeTick(const std::string& security_id,
                                     double price) {
    optrisk::TickEvent e;
    e.instrument = {"NSE_FNO", security_id};
    e.last_price = price;
    e.timestamp_ms = 1;
    return e;
  }

  static optrisk::ExitFailedEvent makeFailure(optrisk::domain::PositionId id) {
    optrisk::ExitFailedEvent e;
    e.position_id = id;
    e.reason = "stop_loss_hit";
    e.error = "broker rejected";
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber must be invoked for every event type.
// Why: A logger subscribes generically and must see every event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const optrisk::Event&) { ++call_count; });

  bus.publish(makeTick("43210", 100.0));
  bus.publish(makeFailure(1));
  bus.publish(optrisk::UnderlyingStateEvent{});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber must fire only for its registered event type.
// Why: PositionStore subscribes to TickEvent on the tick bus, which also
//      carries UnderlyingStateEvent. It must never see the wrong type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int tick_count = 0;
  bus.subscribe<optrisk::TickEvent>(
      [&tick_count](const optrisk::TickEvent&) { ++tick_count; });

  bus.publish(makeTick("43210", 100.0));
  bus.publish(optrisk::UnderlyingStateEvent{});

  EXPECT_EQ(tick_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers must all receive the same published event.
// Why: PositionStore, LtpCache and UnderlyingStateStore share the tick bus.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;

  bus.subscribe<optrisk::TickEvent>(
      [&count_a](const optrisk::TickEvent&) { ++count_a; });
  bus.subscribe<optrisk::TickEvent>(
      [&count_b](const optrisk::TickEvent&) { ++count_b; });

  bus.publish(makeTick("43210", 100.0));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback must not fire for future publishes.
// Why: Components unsubscribe in their destructors. A late callback would
//      touch a destroyed store.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<optrisk::TickEvent>(
      [&call_count](const optrisk::TickEvent&) { ++call_count; });

  bus.publish(makeTick("43210", 100.0));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);

  bus.publish(makeTick("43210", 101.0));
  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Unsubscribing a non-existent id and publishing to an empty bus are
//    harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnknownUnsubscribeAndEmptyPublishAreNoOps) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeTick("43210", 100.0)));
}

// -----------------------------------------------------------------------------
// 6. A subscriber that calls publish() inside its callback must not deadlock.
// Why: The subscriber list is copied before callbacks run. Holding the lock
//      across callbacks would hang this test.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int failures_seen = 0;

  bus.subscribe<optrisk::ExitFailedEvent>(
      [&failures_seen](const optrisk::ExitFailedEvent&) { ++failures_seen; });

  bus.subscribe<optrisk::TickEvent>([this](const optrisk::TickEvent&) {
    bus.publish(makeFailure(7));
  });

  bus.publish(makeTick("43210", 100.0));

  EXPECT_EQ(failures_seen, 1);
}

// -----------------------------------------------------------------------------
// 7. A subscriber that throws must not prevent delivery to later subscribers.
// Why: A failing telemetry bridge must never stop PositionStore from marking
//      positions to market.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberIsIsolated) {
  int delivered = 0;

  bus.subscribe<optrisk::TickEvent>([](const optrisk::TickEvent&) {
    throw std::runtime_error("subscriber failure");
  });
  bus.subscribe<optrisk::TickEvent>(
      [&delivered](const optrisk::TickEvent&) { ++delivered; });

  EXPECT_NO_THROW(bus.publish(makeTick("43210", 100.0)));
  EXPECT_EQ(delivered, 1);
}

// -----------------------------------------------------------------------------
// 8. Field values must survive the variant dispatch path.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  optrisk::TickEvent received;

  bus.subscribe<optrisk::TickEvent>(
      [&received](const optrisk::TickEvent& e) { received = e; });

  bus.publish(makeTick("55555", 237.50));

  EXPECT_EQ(received.instrument.composite(), "NSE_FNO:55555");
  EXPECT_DOUBLE_EQ(received.last_price, 237.50);
}
