#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace optrisk {

// -----------------------------------------------------------------------------
// SweepThread: periodic risk sweep with an adaptive interval
// -----------------------------------------------------------------------------
//
// @brief  Runs a sweep callable on a dedicated thread, then sleeps for the
//         busy interval if positions remain open or the idle interval if the
//         book is empty.
//
// @details
// The callable returns the number of positions still open after the pass;
// that number picks the next interval:
//
//   open > 0  → busy_interval_ms   (default 500)
//   open == 0 → idle_interval_ms   (default 5000)
//
// wake() cuts the current sleep short. RiskManager calls it when a position
// is added (so a new fill is evaluated within one pass rather than after the
// idle interval) and when one is removed.
//
// The sleep is a condition_variable wait on the thread's own mutex; nothing
// else is ever locked by the waiting thread, so the sweep never stalls behind
// the tick path.
//
// A std::exception escaping the callable is logged and the loop continues
// with the busy interval.
//
// Thread model:
//   start()/stop() from the owner's thread; wake() from any thread.
//
// Ownership:
//   Owned by RiskManager. The callable captures RiskManager by reference and
//   must not outlive it; RiskManager::stop() joins this thread first.
// -----------------------------------------------------------------------------
class SweepThread {
 public:
  using SweepFn = std::function<std::size_t()>;

  SweepThread(SweepFn sweep, std::chrono::milliseconds busy_interval,
              std::chrono::milliseconds idle_interval);

  ~SweepThread();

  SweepThread(const SweepThread&) = delete;
  SweepThread& operator=(const SweepThread&) = delete;
  SweepThread(SweepThread&&) = delete;
  SweepThread& operator=(SweepThread&&) = delete;

  void start();

  // Wakes and joins the worker. Idempotent.
  void stop();

  // Ends the current sleep early. Safe from any thread, including the sweep.
  void wake();

  bool running() const { return running_.load(); }

  std::uint64_t passes() const { return passes_.load(); }

 private:
  void run();

  SweepFn sweep_;
  std::chrono::milliseconds busy_interval_;
  std::chrono::milliseconds idle_interval_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> passes_{0};

  std::mutex mutex_;
  std::condition_variable cv_;
  bool wake_requested_{false};  // Guarded by mutex_
  std::thread thread_;
};

}  // namespace optrisk
