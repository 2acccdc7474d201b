#pragma once

#include <atomic>
#include <cstdint>

namespace optrisk {

// -----------------------------------------------------------------------------
// PositionIdGenerator: monotonically increasing PositionId source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique position ids. 0 is reserved as "unset", so the
//         first id is 1.
//
// @details
// Fills can be registered concurrently (IPC ADD on the IPC thread, direct
// addPosition() from the embedding application), hence the atomic.
//
// Hydrated positions keep the id they were persisted with; RiskManager calls
// observe() for each of them so freshly issued ids never collide with a
// restored one.
//
// Thread model:
//   next_id() and observe() are safe to call concurrently from any thread.
//
// Ownership:
//   Value member of RiskManager.
// -----------------------------------------------------------------------------
class PositionIdGenerator {
 public:
  PositionIdGenerator() = default;

  PositionIdGenerator(const PositionIdGenerator&) = delete;
  PositionIdGenerator& operator=(const PositionIdGenerator&) = delete;
  PositionIdGenerator(PositionIdGenerator&&) = delete;
  PositionIdGenerator& operator=(PositionIdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @return A value unique across all calls on this instance.
  //
  // Relaxed ordering: uniqueness is the only requirement.
  // -------------------------------------------------------------------------
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // observe(id)
  // -------------------------------------------------------------------------
  // @brief  Ensures every later next_id() returns something greater than id.
  // -------------------------------------------------------------------------
  void observe(std::uint64_t id) {
    std::uint64_t wanted = id + 1;
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current < wanted &&
           !next_id_.compare_exchange_weak(current, wanted,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace optrisk
