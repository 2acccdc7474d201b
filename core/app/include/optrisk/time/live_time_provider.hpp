#pragma once

#include "optrisk/time/i_time_provider.hpp"

namespace optrisk {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Delegates to std::chrono::system_clock. Stateless, so safe from any thread.
// Selected when the config says "clock": "live" (the default).
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace optrisk
