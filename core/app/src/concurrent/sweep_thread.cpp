#include "optrisk/concurrent/sweep_thread.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace optrisk {

SweepThread::SweepThread(SweepFn sweep,
                         std::chrono::milliseconds busy_interval,
                         std::chrono::milliseconds idle_interval)
    : sweep_(std::move(sweep)),
      busy_interval_(busy_interval),
      idle_interval_(idle_interval) {}

SweepThread::~SweepThread() { stop(); }

void SweepThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void SweepThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    running_.store(false);
    wake_requested_ = true;
  }
  cv_.notify_all();
  thread_.join();
}

void SweepThread::wake() {
  {
    std::lock_guard lock(mutex_);
    wake_requested_ = true;
  }
  cv_.notify_all();
}

// -----------------------------------------------------------------------------
// run(): sweep, then sleep for the interval the result asks for
// -----------------------------------------------------------------------------
void SweepThread::run() {
  while (running_.load()) {
    std::size_t open = 0;
    try {
      open = sweep_();
    } catch (const std::exception& e) {
      std::cerr << "[SweepThread] Sweep pass failed: " << e.what() << "\n";
      open = 1;
    }
    ++passes_;

    auto interval = open > 0 ? busy_interval_ : idle_interval_;

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval,
                 [this] { return wake_requested_ || !running_.load(); });
    wake_requested_ = false;
  }
}

}  // namespace optrisk
