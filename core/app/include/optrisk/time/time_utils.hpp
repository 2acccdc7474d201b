#pragma once

#include <cstdint>

namespace optrisk {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Helpers that turn the engine's epoch-ms clock into the quantities
//         the exit rules reason about.
//
// Thread-safety: Stateless; safe from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr std::int64_t kMinutesPerDay = 24 * 60;

// -------------------------------------------------------------------------
// local_minute_of_day
// -------------------------------------------------------------------------
// @brief  Minutes after local midnight for an epoch-ms instant.
//
// @param  epoch_ms            UTC epoch milliseconds.
// @param  utc_offset_minutes  Local offset from UTC (IST = +330).
// @return 0..1439
//
// @details
// Floor division keeps the result in range for instants before the epoch,
// which only ever shows up with hand-built test timestamps.
// -------------------------------------------------------------------------
inline int local_minute_of_day(std::int64_t epoch_ms, int utc_offset_minutes) {
  std::int64_t local_minutes =
      epoch_ms / kMsPerMinute - (epoch_ms % kMsPerMinute < 0 ? 1 : 0) +
      utc_offset_minutes;
  std::int64_t minute_of_day = local_minutes % kMinutesPerDay;
  if (minute_of_day < 0) {
    minute_of_day += kMinutesPerDay;
  }
  return static_cast<int>(minute_of_day);
}

// -------------------------------------------------------------------------
// seconds_between
// -------------------------------------------------------------------------
// @return (to_ms − from_ms) in seconds, clamped at 0 so a clock that lags
//         the feed never produces negative durations.
// -------------------------------------------------------------------------
inline double seconds_between(std::int64_t from_ms, std::int64_t to_ms) {
  if (to_ms <= from_ms) {
    return 0.0;
  }
  return static_cast<double>(to_ms - from_ms) / kMsPerSecond;
}

}  // namespace optrisk
