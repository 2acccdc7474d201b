#pragma once

#include "optrisk/concurrent/thread_safe_queue.hpp"
#include "optrisk/eventbus/event_bus.hpp"
#include "optrisk/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace optrisk {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. RiskManager uses one as the
// notification loop: ExitCoordinator pushes ExitNotificationEvent /
// ExitFailedEvent from the sweep thread, and subscribers (logger, IPC
// telemetry bridge) run serialized on the loop thread, off the exit path.
//
// Thread model: start() and stop() may be called from any thread. push() is
// safe from any thread. Every subscriber callback runs on the loop thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  // name is used only in log lines. capacity bounds the queue for tryPush();
  // 0 means unbounded.
  explicit EventLoopThread(std::string name = "EventLoop",
                           std::size_t capacity = 0);

  // Joins the worker so it never outlives the queue and bus.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Spawns the worker. No-op if it is already running.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Signals the worker, wakes it, joins it. Events still queued are
  // published before the worker exits so a notification pushed just before
  // shutdown is not lost. Idempotent; start() may be called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueue unconditionally.
  void push(Event event) { queue_.push(std::move(event)); }

  // -------------------------------------------------------------------------
  // tryPush(event)
  // -------------------------------------------------------------------------
  // Enqueue unless the bounded queue is full.
  // Output: false if the event was dropped.
  // -------------------------------------------------------------------------
  bool tryPush(Event event) { return queue_.try_push(std::move(event)); }

  // Subscribe here to receive events on the loop thread.
  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

 private:
  // -------------------------------------------------------------------------
  // run(): worker thread entry point
  // -------------------------------------------------------------------------
  // try_pop() and publish; on an empty queue wait briefly on stop_cv_ so
  // stop() is noticed without a "close" operation on the queue.
  // -------------------------------------------------------------------------
  void run();

  void drain();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace optrisk
