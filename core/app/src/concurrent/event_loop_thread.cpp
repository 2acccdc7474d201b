#include "optrisk/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace optrisk {

namespace {

// Idle wait between queue polls. Bounds stop() latency.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
EventLoopThread::EventLoopThread(std::string name, std::size_t capacity)
    : name_(std::move(name)), queue_(capacity) {}

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }

  // Set before spawning so the worker's first check sees true.
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  stop_cv_.notify_all();

  // No lock held across join(); the worker may need stop_mutex_ to exit.
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }

  drain();
}

// -----------------------------------------------------------------------------
// drain(): publish whatever is still queued at shutdown
// -----------------------------------------------------------------------------
void EventLoopThread::drain() {
  std::size_t drained = 0;
  while (auto event = queue_.try_pop()) {
    bus_.publish(*event);
    ++drained;
  }
  if (drained > 0) {
    std::cout << "[" << name_ << "] drained " << drained
              << " event(s) on shutdown.\n";
  }
}

}  // namespace optrisk
