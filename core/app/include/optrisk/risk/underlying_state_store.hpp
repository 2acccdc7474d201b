#pragma once

#include "optrisk/eventbus/event_bus.hpp"
#include "optrisk/events/event_types.hpp"
#include "optrisk/risk/i_underlying_state_provider.hpp"
#include "optrisk/time/i_time_provider.hpp"

#include <cstdint>
#include <shared_mutex>
#include <unordered_map>

namespace optrisk {

// -----------------------------------------------------------------------------
// UnderlyingStateStore: latest UnderlyingState per index, with staleness
// -----------------------------------------------------------------------------
//
// @brief  IUnderlyingStateProvider backed by "underlying_state" messages from
//         the market data feed.
//
// @details
// Keeps only the newest snapshot per underlying; an older observed_at_ms
// never replaces a newer one. A snapshot with observed_at_ms == 0 is stamped
// with the clock on arrival.
//
// latest() returns std::nullopt once now − observed_at > max_staleness_ms.
// A stale "structure broken" is not a reason to exit minutes later.
//
// Thread model:
//   onState() on the market data thread (unique lock); latest() on the sweep
//   thread (shared lock).
//
// Ownership:
//   Owned by RiskManager. Subscribes to UnderlyingStateEvent on the tick bus.
// -----------------------------------------------------------------------------
class UnderlyingStateStore final : public IUnderlyingStateProvider {
 public:
  UnderlyingStateStore(EventBus& tick_bus, const ITimeProvider& clock,
                       std::int64_t max_staleness_ms);
  ~UnderlyingStateStore() override;

  UnderlyingStateStore(const UnderlyingStateStore&) = delete;
  UnderlyingStateStore& operator=(const UnderlyingStateStore&) = delete;
  UnderlyingStateStore(UnderlyingStateStore&&) = delete;
  UnderlyingStateStore& operator=(UnderlyingStateStore&&) = delete;

  void onState(const UnderlyingStateEvent& event);

  std::optional<domain::UnderlyingState> latest(
      const domain::InstrumentKey& underlying) const override;

 private:
  EventBus& tick_bus_;
  EventBus::SubscriptionId sub_id_{0};
  const ITimeProvider& clock_;
  const std::int64_t max_staleness_ms_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::InstrumentKey, domain::UnderlyingState,
                     domain::InstrumentKeyHash>
      states_;
};

}  // namespace optrisk
