#pragma once

#include <cstdint>

namespace optrisk {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Every component that needs "now" receives one of these instead of
//         calling std::chrono::system_clock directly.
//
// @details
// Time drives three exit decisions: seconds spent underwater (downward
// adaptive stop), the session-end cutoff, and the holding-time stop. It also
// decides whether an underlying snapshot is stale. Injecting the clock makes
// all of them deterministic under test and during replay:
//
//   - LiveTimeProvider       → system_clock.
//   - SimulationTimeProvider → value set by the test or by the gateway from
//                              tick timestamps.
//
// Units: int64_t milliseconds since the Unix epoch (UTC), the same unit the
// tick feed uses.
//
// Thread-safety contract:
//   now_ms() is called concurrently from the market data, sweep and IPC
//   threads. Implementations must be safe for concurrent reads.
//
// Ownership:
//   Components hold a const reference. The provider outlives them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @return Epoch milliseconds. May be 0 for a simulation clock that has not
  //         been advanced yet.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace optrisk
