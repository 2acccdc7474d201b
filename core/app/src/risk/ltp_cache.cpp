#include "optrisk/risk/ltp_cache.hpp"

#include <mutex>

namespace optrisk {

LtpCache::LtpCache(EventBus& tick_bus) : tick_bus_(tick_bus) {
  tick_sub_id_ = tick_bus_.subscribe<TickEvent>(
      [this](const TickEvent& e) { onTick(e); });
}

LtpCache::~LtpCache() { tick_bus_.unsubscribe(tick_sub_id_); }

// -----------------------------------------------------------------------------
// onTick: remember the latest valid price
// -----------------------------------------------------------------------------
void LtpCache::onTick(const TickEvent& tick) {
  if (!tick.instrument.valid() || !(tick.last_price > 0.0)) {
    return;
  }
  std::unique_lock lock(mutex_);
  prices_[tick.instrument] = tick.last_price;
}

std::optional<double> LtpCache::lastPrice(
    const domain::InstrumentKey& key) const {
  std::shared_lock lock(mutex_);
  auto it = prices_.find(key);
  if (it == prices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t LtpCache::size() const {
  std::shared_lock lock(mutex_);
  return prices_.size();
}

}  // namespace optrisk
