#pragma once

#include "optrisk/domain/position.hpp"
#include "optrisk/eventbus/event_bus.hpp"
#include "optrisk/events/event_types.hpp"
#include "optrisk/time/i_time_provider.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// PositionStore: concurrent in-memory book of open positions
// -----------------------------------------------------------------------------
//
// @brief  Owns every open Position. Marks them to market on each tick and
//         keeps the derived state the exit rules depend on: PnL, peak profit,
//         high-water-mark, time under water and the trailing SL offset.
//
// @details
// Layout:
//
//   shards_[16]   each { std::mutex, unordered_map<PositionId, Position> }
//                 a position lives in shard (id % 16)
//   index_        composite instrument key → ids trading that instrument,
//                 guarded by a std::shared_mutex (read-mostly)
//
// There is no global lock. A tick for one instrument locks only the shards
// of the positions on that instrument, one at a time, so ticks for different
// positions proceed in parallel and a sweep copying the book never blocks
// the feed for more than one shard.
//
// Mark-to-market (applyTick):
//
//   pnl      = (ltp − entry) × qty × sign
//   pnl_pct  = (ltp − entry) / entry × 100 × sign        rounded to 4 dp
//   hwm      = max(hwm, pnl)
//   peak     = max(peak, pnl_pct)
//   underwater_since_ms set on the first negative tick, cleared at pnl ≥ 0
//
// Invariants enforced here:
//   - peak_profit_pct never decreases (out-of-order ticks included).
//   - sl_offset_pct only tightens: update() ignores a less protective value.
//   - A removed position is gone; later ticks and updates are no-ops.
//
// Thread model:
//   onTick() runs on the market data thread (via the tick bus subscription).
//   update()/allOpen()/snapshot() run on the sweep thread, remove() on
//   whichever thread executes an exit, add() on the caller's thread. All
//   methods are thread-safe.
//
// Ownership:
//   Owned by RiskManager via std::unique_ptr. Subscribes to TickEvent on the
//   tick bus in the constructor and unsubscribes in the destructor.
// -----------------------------------------------------------------------------
class PositionStore {
 public:
  using RemovalCallback = std::function<void(domain::PositionId)>;

  static constexpr std::size_t kShardCount = 16;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  tick_bus  Bus carrying TickEvent; the store subscribes to it.
  // @param  clock     Source of "now" for underwater_since_ms and for
  //                   ticks that arrive without a timestamp.
  // -------------------------------------------------------------------------
  PositionStore(EventBus& tick_bus, const ITimeProvider& clock);

  ~PositionStore();

  PositionStore(const PositionStore&) = delete;
  PositionStore& operator=(const PositionStore&) = delete;
  PositionStore(PositionStore&&) = delete;
  PositionStore& operator=(PositionStore&&) = delete;

  // -------------------------------------------------------------------------
  // add(position)
  // -------------------------------------------------------------------------
  // @brief  Registers a freshly filled position.
  //
  // @details
  // Resets the derived state: pnl 0, peak 0, hwm 0, no trailing offset, not
  // breakeven-locked, not under water, status Open, ltp 0 until the first
  // tick. opened_at_ms defaults to now if the caller left it at 0.
  //
  // @throws std::invalid_argument on id 0, a duplicate id, an invalid
  //         instrument key or a non-positive entry price or quantity.
  // -------------------------------------------------------------------------
  void add(domain::Position position);

  // -------------------------------------------------------------------------
  // hydrate(position)
  // -------------------------------------------------------------------------
  // @brief  Restores a position persisted by a previous session.
  //
  // @details
  // Unlike add(), keeps the restored peak_profit_pct, high_water_mark,
  // sl_offset_pct and breakeven flag so a restart does not loosen the
  // trailing stop. Status is forced to Open.
  //
  // @throws std::invalid_argument under the same conditions as add().
  // -------------------------------------------------------------------------
  void hydrate(domain::Position position);

  // -------------------------------------------------------------------------
  // onTick(tick)
  // -------------------------------------------------------------------------
  // @brief  Marks every position on tick.instrument to market.
  //
  // @details
  // Ticks with last_price ≤ 0 or an incomplete instrument key are dropped
  // and logged. A tick for an instrument nobody holds is a silent no-op.
  // Never triggers an exit; exit decisions belong to the sweep.
  //
  // Thread-safety: Safe from any thread. Atomic per position.
  // -------------------------------------------------------------------------
  void onTick(const TickEvent& tick);

  // -------------------------------------------------------------------------
  // update(id, changes)
  // -------------------------------------------------------------------------
  // @brief  Applies derived-field changes requested by rules, the trailing
  //         engine or the exit coordinator.
  //
  // @return true if the position exists (even if every change was a no-op
  //         because it would have loosened the stop), false otherwise.
  // -------------------------------------------------------------------------
  bool update(domain::PositionId id, const domain::PositionUpdate& changes);

  // -------------------------------------------------------------------------
  // remove(id)
  // -------------------------------------------------------------------------
  // @brief  Drops a closed position and fires the removal callback.
  // @return true if it was present.
  // -------------------------------------------------------------------------
  bool remove(domain::PositionId id);

  // -------------------------------------------------------------------------
  // allOpen()
  // -------------------------------------------------------------------------
  // @brief  Copies every position, one shard at a time.
  //
  // @details
  // No lock is held across shards, so the result is not a single atomic
  // cut of the book: a tick landing in shard 7 while shard 3 is being copied
  // may or may not be reflected. The sweep tolerates that; the next pass sees
  // it. Calling again simply starts a new pass.
  //
  // Ordered by id so sweep logs read in a stable order.
  // -------------------------------------------------------------------------
  std::vector<domain::Position> allOpen() const;

  // Copy of one position, std::nullopt if unknown.
  std::optional<domain::Position> snapshot(domain::PositionId id) const;

  std::size_t size() const;

  std::uint64_t droppedTicks() const { return dropped_ticks_.load(); }

  // -------------------------------------------------------------------------
  // setRemovalCallback(cb)
  // -------------------------------------------------------------------------
  // Invoked after a successful remove(), outside every store lock. RiskManager
  // binds it to SweepThread::wake() so the sweep re-evaluates its interval.
  // Set once during wiring, before any thread calls remove().
  // -------------------------------------------------------------------------
  void setRemovalCallback(RemovalCallback cb) {
    removal_callback_ = std::move(cb);
  }

  // -------------------------------------------------------------------------
  // applyTick(pos, price, tick_ms, now_ms)
  // -------------------------------------------------------------------------
  // @brief  The mark-to-market math, on a position the caller has locked.
  // @param  tick_ms  Timestamp recorded as last_update_ms (never regresses).
  // @param  now_ms   Clock reading used for underwater_since_ms.
  // -------------------------------------------------------------------------
  static void applyTick(domain::Position& pos, double price,
                        std::int64_t tick_ms, std::int64_t now_ms);

 private:
  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<domain::PositionId, domain::Position> positions;
  };

  Shard& shardFor(domain::PositionId id) {
    return shards_[id % kShardCount];
  }
  const Shard& shardFor(domain::PositionId id) const {
    return shards_[id % kShardCount];
  }

  void insert(domain::Position position, const char* origin);
  static void validate(const domain::Position& position);

  EventBus& tick_bus_;
  EventBus::SubscriptionId tick_sub_id_{0};
  const ITimeProvider& clock_;

  std::array<Shard, kShardCount> shards_;

  mutable std::shared_mutex index_mutex_;
  std::unordered_map<std::string, std::vector<domain::PositionId>> index_;

  RemovalCallback removal_callback_;
  std::atomic<std::uint64_t> dropped_ticks_{0};
};

}  // namespace optrisk
