#include "optrisk/risk/position_store.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace optrisk {

// -----------------------------------------------------------------------------
// Constructor: subscribe to TickEvent on the tick bus
// -----------------------------------------------------------------------------
PositionStore::PositionStore(EventBus& tick_bus, const ITimeProvider& clock)
    : tick_bus_(tick_bus), clock_(clock) {
  tick_sub_id_ = tick_bus_.subscribe<TickEvent>(
      [this](const TickEvent& e) { onTick(e); });
}

// -----------------------------------------------------------------------------
// Destructor: unsubscribe so no tick lands in a destroyed store
// -----------------------------------------------------------------------------
PositionStore::~PositionStore() { tick_bus_.unsubscribe(tick_sub_id_); }

// -----------------------------------------------------------------------------
// validate: reject positions the PnL math cannot handle
// -----------------------------------------------------------------------------
void PositionStore::validate(const domain::Position& position) {
  if (position.id == 0) {
    throw std::invalid_argument("position id 0 is reserved");
  }
  if (!position.instrument.valid()) {
    throw std::invalid_argument("position " + std::to_string(position.id) +
                                " has an incomplete instrument key");
  }
  if (position.entry_price <= 0.0) {
    throw std::invalid_argument("position " + std::to_string(position.id) +
                                " has a non-positive entry price");
  }
  if (position.quantity <= 0.0) {
    throw std::invalid_argument("position " + std::to_string(position.id) +
                                " has a non-positive quantity");
  }
}

// -----------------------------------------------------------------------------
// add: register a new fill with fresh derived state
// -----------------------------------------------------------------------------
void PositionStore::add(domain::Position position) {
  validate(position);

  position.ltp = 0.0;
  position.pnl = 0.0;
  position.pnl_pct = 0.0;
  position.high_water_mark = 0.0;
  position.peak_profit_pct = 0.0;
  position.underwater_since_ms.reset();
  position.sl_offset_pct.reset();
  position.breakeven_locked = false;
  position.status = domain::PositionStatus::Open;
  if (position.opened_at_ms == 0) {
    position.opened_at_ms = clock_.now_ms();
  }
  position.last_update_ms = position.opened_at_ms;

  insert(std::move(position), "added");
}

// -----------------------------------------------------------------------------
// hydrate: restore a persisted position, keeping its peak and trailing state
// -----------------------------------------------------------------------------
void PositionStore::hydrate(domain::Position position) {
  validate(position);

  position.status = domain::PositionStatus::Open;
  position.peak_profit_pct = std::max(position.peak_profit_pct, 0.0);
  if (position.opened_at_ms == 0) {
    position.opened_at_ms = clock_.now_ms();
  }
  if (position.last_update_ms < position.opened_at_ms) {
    position.last_update_ms = position.opened_at_ms;
  }

  insert(std::move(position), "hydrated");
}

// -----------------------------------------------------------------------------
// insert: shard first, then index
// -----------------------------------------------------------------------------
void PositionStore::insert(domain::Position position, const char* origin) {
  const domain::PositionId id = position.id;
  const std::string key = position.instrument.composite();

  {
    Shard& shard = shardFor(id);
    std::lock_guard lock(shard.mutex);
    if (shard.positions.count(id) != 0) {
      throw std::invalid_argument("duplicate position id " +
                                  std::to_string(id));
    }
    shard.positions.emplace(id, std::move(position));
  }

  {
    std::unique_lock lock(index_mutex_);
    index_[key].push_back(id);
  }

  std::cout << "[PositionStore] " << origin << " position " << id << " on "
            << key << "\n";
}

// -----------------------------------------------------------------------------
// onTick: look up by instrument, mark each position to market
// -----------------------------------------------------------------------------
void PositionStore::onTick(const TickEvent& tick) {
  if (!tick.instrument.valid() || !(tick.last_price > 0.0)) {
    dropped_ticks_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[PositionStore] dropping malformed tick: key='"
              << tick.instrument.composite() << "' price=" << tick.last_price
              << "\n";
    return;
  }

  // Copy the id list under the shared lock, then release it before taking
  // any shard lock. Lock order is never index → shard held together.
  std::vector<domain::PositionId> ids;
  {
    std::shared_lock lock(index_mutex_);
    auto it = index_.find(tick.instrument.composite());
    if (it == index_.end()) {
      return;
    }
    ids = it->second;
  }

  const std::int64_t now = clock_.now_ms();
  const std::int64_t tick_ms = tick.timestamp_ms > 0 ? tick.timestamp_ms : now;

  for (domain::PositionId id : ids) {
    Shard& shard = shardFor(id);
    std::lock_guard lock(shard.mutex);
    auto it = shard.positions.find(id);
    if (it == shard.positions.end()) {
      continue;  // removed after we copied the id list
    }
    applyTick(it->second, tick.last_price, tick_ms, now);
  }
}

// -----------------------------------------------------------------------------
// applyTick: mark-to-market math (static, mutates pos only)
// -----------------------------------------------------------------------------
void PositionStore::applyTick(domain::Position& pos, double price,
                              std::int64_t tick_ms, std::int64_t now_ms) {
  if (pos.status == domain::PositionStatus::Closed) {
    return;
  }

  const double sign = domain::sideSign(pos.side);

  pos.ltp = price;
  pos.pnl = (price - pos.entry_price) * pos.quantity * sign;
  pos.pnl_pct = domain::roundTo(domain::pnlPctAtPrice(pos, price), 4);

  // Maxima only move up, so a late or replayed tick cannot erase a peak.
  pos.high_water_mark = std::max(pos.high_water_mark, pos.pnl);
  pos.peak_profit_pct = std::max(pos.peak_profit_pct, pos.pnl_pct);

  if (pos.pnl < 0.0) {
    if (!pos.underwater_since_ms) {
      pos.underwater_since_ms = now_ms;
    }
  } else {
    pos.underwater_since_ms.reset();
  }

  pos.last_update_ms = std::max(pos.last_update_ms, tick_ms);
}

// -----------------------------------------------------------------------------
// update: tighten-only offset, max-merged peak, free-form flags
// -----------------------------------------------------------------------------
bool PositionStore::update(domain::PositionId id,
                           const domain::PositionUpdate& changes) {
  Shard& shard = shardFor(id);
  std::lock_guard lock(shard.mutex);

  auto it = shard.positions.find(id);
  if (it == shard.positions.end()) {
    return false;
  }
  domain::Position& pos = it->second;

  if (changes.sl_offset_pct) {
    // Higher offset = stop closer to (or further above) entry = tighter.
    if (!pos.sl_offset_pct || *changes.sl_offset_pct > *pos.sl_offset_pct) {
      pos.sl_offset_pct = changes.sl_offset_pct;
    }
  }

  if (changes.breakeven_locked) {
    pos.breakeven_locked = *changes.breakeven_locked;
  }

  if (changes.status) {
    pos.status = *changes.status;
  }

  if (changes.peak_profit_pct) {
    pos.peak_profit_pct = std::max(pos.peak_profit_pct, *changes.peak_profit_pct);
  }

  return true;
}

// -----------------------------------------------------------------------------
// remove: shard, then index, then callback outside all locks
// -----------------------------------------------------------------------------
bool PositionStore::remove(domain::PositionId id) {
  std::string key;

  {
    Shard& shard = shardFor(id);
    std::lock_guard lock(shard.mutex);
    auto it = shard.positions.find(id);
    if (it == shard.positions.end()) {
      return false;
    }
    key = it->second.instrument.composite();
    shard.positions.erase(it);
  }

  {
    std::unique_lock lock(index_mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
      auto& ids = it->second;
      ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
      if (ids.empty()) {
        index_.erase(it);
      }
    }
  }

  if (removal_callback_) {
    removal_callback_(id);
  }
  return true;
}

// -----------------------------------------------------------------------------
// allOpen: shard-by-shard copy
// -----------------------------------------------------------------------------
std::vector<domain::Position> PositionStore::allOpen() const {
  std::vector<domain::Position> result;

  for (const Shard& shard : shards_) {
    std::lock_guard lock(shard.mutex);
    for (const auto& [id, pos] : shard.positions) {
      result.push_back(pos);
    }
  }

  std::sort(result.begin(), result.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.id < b.id;
            });
  return result;
}

// -----------------------------------------------------------------------------
// snapshot: read-only copy of one position
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionStore::snapshot(
    domain::PositionId id) const {
  const Shard& shard = shardFor(id);
  std::lock_guard lock(shard.mutex);
  auto it = shard.positions.find(id);
  if (it == shard.positions.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// size: sum across shards
// -----------------------------------------------------------------------------
std::size_t PositionStore::size() const {
  std::size_t total = 0;
  for (const Shard& shard : shards_) {
    std::lock_guard lock(shard.mutex);
    total += shard.positions.size();
  }
  return total;
}

}  // namespace optrisk
