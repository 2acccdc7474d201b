#include "optrisk/risk/underlying_state_store.hpp"

#include <iostream>
#include <mutex>

namespace optrisk {

UnderlyingStateStore::UnderlyingStateStore(EventBus& tick_bus,
                                           const ITimeProvider& clock,
                                           std::int64_t max_staleness_ms)
    : tick_bus_(tick_bus),
      clock_(clock),
      max_staleness_ms_(max_staleness_ms) {
  sub_id_ = tick_bus_.subscribe<UnderlyingStateEvent>(
      [this](const UnderlyingStateEvent& e) { onState(e); });
}

UnderlyingStateStore::~UnderlyingStateStore() {
  tick_bus_.unsubscribe(sub_id_);
}

// -----------------------------------------------------------------------------
// onState: keep the newest snapshot per underlying
// -----------------------------------------------------------------------------
void UnderlyingStateStore::onState(const UnderlyingStateEvent& event) {
  domain::UnderlyingState state = event.state;
  if (!state.underlying.valid()) {
    std::cerr << "[UnderlyingStateStore] dropping snapshot with incomplete key '"
              << state.underlying.composite() << "'\n";
    return;
  }
  if (state.observed_at_ms == 0) {
    state.observed_at_ms = clock_.now_ms();
  }

  std::unique_lock lock(mutex_);
  auto it = states_.find(state.underlying);
  if (it != states_.end() && it->second.observed_at_ms > state.observed_at_ms) {
    return;
  }
  states_[state.underlying] = std::move(state);
}

// -----------------------------------------------------------------------------
// latest: fresh snapshot or nothing
// -----------------------------------------------------------------------------
std::optional<domain::UnderlyingState> UnderlyingStateStore::latest(
    const domain::InstrumentKey& underlying) const {
  std::shared_lock lock(mutex_);
  auto it = states_.find(underlying);
  if (it == states_.end()) {
    return std::nullopt;
  }
  if (clock_.now_ms() - it->second.observed_at_ms > max_staleness_ms_) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace optrisk
