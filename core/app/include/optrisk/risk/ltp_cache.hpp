#pragma once

#include "optrisk/domain/instrument_key.hpp"
#include "optrisk/eventbus/event_bus.hpp"
#include "optrisk/events/event_types.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace optrisk {

// -----------------------------------------------------------------------------
// ILastPriceSource: secondary price lookup for exits
// -----------------------------------------------------------------------------
// ExitCoordinator consults it when the store has no LTP for the position
// (no tick since entry). Separate interface so tests can inject fixed prices.
// -----------------------------------------------------------------------------
class ILastPriceSource {
 public:
  virtual ~ILastPriceSource() = default;

  // @return Last valid traded price for key, std::nullopt if never seen.
  virtual std::optional<double> lastPrice(
      const domain::InstrumentKey& key) const = 0;
};

// -----------------------------------------------------------------------------
// LtpCache: last traded price per instrument, fed by the tick bus
// -----------------------------------------------------------------------------
//
// @brief  Remembers the last valid price for every instrument seen on the
//         feed, whether or not a position is open on it.
//
// @details
// Unlike PositionStore, which only tracks instruments with open positions,
// the cache also holds prices that arrived before a fill was registered. That
// is exactly the window in which the store's ltp is still 0.
//
// Malformed ticks (price ≤ 0, incomplete key) are ignored here without a log
// line; PositionStore already logs them once.
//
// Thread model:
//   onTick() writes on the market data thread (unique lock). lastPrice()
//   reads from the sweep or IPC thread (shared lock).
//
// Ownership:
//   Owned by RiskManager. Subscribes to TickEvent in the constructor,
//   unsubscribes in the destructor.
// -----------------------------------------------------------------------------
class LtpCache final : public ILastPriceSource {
 public:
  explicit LtpCache(EventBus& tick_bus);
  ~LtpCache() override;

  LtpCache(const LtpCache&) = delete;
  LtpCache& operator=(const LtpCache&) = delete;
  LtpCache(LtpCache&&) = delete;
  LtpCache& operator=(LtpCache&&) = delete;

  void onTick(const TickEvent& tick);

  std::optional<double> lastPrice(
      const domain::InstrumentKey& key) const override;

  std::size_t size() const;

 private:
  EventBus& tick_bus_;
  EventBus::SubscriptionId tick_sub_id_{0};

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::InstrumentKey, double, domain::InstrumentKeyHash>
      prices_;
};

}  // namespace optrisk
