// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for optrisk::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO ordering through push / pop / try_pop
//   - try_pop() on an empty queue returns std::nullopt without blocking
//   - Blocking pop() waits for a producer
//   - Bounded try_push() refuses items once capacity is reached
//   - No loss or duplication under concurrent producers and consumers
//
// Threading model:
//   Threads spawned by a test are joined before its assertions.
// =============================================================================

#include "optrisk/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  optrisk::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come out in the order they went in.
// Why: The notification loop must deliver an ExitFailedEvent and the retry's
//      ExitNotificationEvent in the order they happened.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  EXPECT_TRUE(queue.empty());

  queue.push(1);
  queue.push(2);
  queue.push(3);
  EXPECT_EQ(queue.size(), 3u);

  EXPECT_EQ(queue.pop(), 1);
  EXPECT_EQ(queue.try_pop(), std::optional<int>(2));
  EXPECT_EQ(queue.pop(), 3);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() on an empty queue returns immediately with no value.
// Why: EventLoopThread polls with try_pop(); blocking here would make stop()
//      hang.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopOnEmptyReturnsNullopt) {
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 3. pop() blocks until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForProducer) {
  auto consumer = std::async(std::launch::async, [this] { return queue.pop(); });

  EXPECT_EQ(consumer.wait_for(std::chrono::milliseconds(50)),
            std::future_status::timeout);

  queue.push(99);

  ASSERT_EQ(consumer.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_EQ(consumer.get(), 99);
}

// -----------------------------------------------------------------------------
// 4. A bounded queue refuses try_push() when full; push() is never refused.
// Why: tryPush() is how a producer avoids unbounded growth when the consumer
//      has stalled.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueBoundedTest, TryPushRespectsCapacity) {
  optrisk::ThreadSafeQueue<int> bounded(2);

  EXPECT_TRUE(bounded.try_push(1));
  EXPECT_TRUE(bounded.try_push(2));
  EXPECT_FALSE(bounded.try_push(3));
  EXPECT_EQ(bounded.size(), 2u);

  EXPECT_EQ(bounded.pop(), 1);
  EXPECT_TRUE(bounded.try_push(3));

  bounded.push(4);
  EXPECT_EQ(bounded.size(), 3u);
}

// -----------------------------------------------------------------------------
// 5. Four producers and four consumers: every value arrives exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 1000;
  constexpr int kTotal = kProducers * kPerProducer;

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> received(kProducers);

  std::vector<std::thread> consumers;
  for (int c = 0; c < kProducers; ++c) {
    consumers.emplace_back([this, c, &consumed, &received] {
      while (consumed.load() < kTotal) {
        if (auto v = queue.try_pop()) {
          received[c].push_back(*v);
          ++consumed;
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(p * kPerProducer + i);
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::set<int> all;
  for (const auto& bucket : received) {
    all.insert(bucket.begin(), bucket.end());
  }
  EXPECT_EQ(all.size(), static_cast<std::size_t>(kTotal));
  EXPECT_EQ(*all.begin(), 0);
  EXPECT_EQ(*all.rbegin(), kTotal - 1);
  EXPECT_TRUE(queue.empty());
}
