#pragma once

#include "optrisk/domain/instrument_key.hpp"
#include "optrisk/domain/underlying_state.hpp"

#include <optional>

namespace optrisk {

// -----------------------------------------------------------------------------
// IUnderlyingStateProvider: read side of the indicator layer
// -----------------------------------------------------------------------------
//
// @brief  Returns the latest health snapshot of an underlying index.
//
// @details
// Indicator computation is outside this engine. UnderlyingExitRule and the
// downward adaptive stop only consume its output through this interface.
//
// Implementations must return std::nullopt when they have nothing usable:
// unknown underlying, or a snapshot too old to act on. Callers treat a
// missing snapshot as "no signal", never as a reason to exit.
//
// Thread model:
//   latest() is called from the sweep thread while snapshots are written from
//   the market data thread. Implementations must be thread-safe.
// -----------------------------------------------------------------------------
class IUnderlyingStateProvider {
 public:
  virtual ~IUnderlyingStateProvider() = default;

  virtual std::optional<domain::UnderlyingState> latest(
      const domain::InstrumentKey& underlying) const = 0;
};

}  // namespace optrisk
