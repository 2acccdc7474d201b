#pragma once

#include "optrisk/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace optrisk {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock for replay and tests
// -----------------------------------------------------------------------------
//
// @brief  "Now" is whatever the last advance_time() said it is.
//
// @details
// With "clock": "simulation" the MarketDataGateway advances this clock from
// each tick's timestamp before publishing the tick, so a replayed session
// hits its 15:20 cutoff at the replayed 15:20, not the wall-clock one.
//
// Tests use it to step time explicitly: open a position, advance 10 minutes,
// sweep, and check that the underwater tightening kicked in.
//
// std::atomic<int64_t> instead of a mutex: one writer (gateway or test), many
// readers on the hot path; the atomic is lock-free on 64-bit targets.
//
// Thread model:
//   advance_time() and now_ms() are safe to call concurrently.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  // @return Epoch ms from the most recent advance_time(), 0 if never set.
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock. Monotonicity is the caller's responsibility.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Convenience for tests: move the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace optrisk
