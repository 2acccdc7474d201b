#pragma once

#include "optrisk/risk/i_position_record.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// InMemoryPositionRecord: process-local IPositionRecord
// -----------------------------------------------------------------------------
// One std::recursive_mutex per record. withExclusiveLock() holds it for the
// whole callback; closed()/markClosed() take it again, which is legal on the
// owning thread and keeps them safe when called from outside the callback.
// -----------------------------------------------------------------------------
class InMemoryPositionRecord final : public IPositionRecord {
 public:
  explicit InMemoryPositionRecord(domain::PositionId id) : id_(id) {}

  InMemoryPositionRecord(const InMemoryPositionRecord&) = delete;
  InMemoryPositionRecord& operator=(const InMemoryPositionRecord&) = delete;

  domain::PositionId id() const override { return id_; }

  void withExclusiveLock(const std::function<void()>& fn) override;

  bool closed() const override;

  void markClosed(double exit_price, const std::string& reason) override;

  std::optional<double> exitPrice() const override;
  std::optional<std::string> exitReason() const override;

 private:
  const domain::PositionId id_;

  mutable std::recursive_mutex mutex_;
  bool closed_{false};
  std::optional<double> exit_price_;
  std::optional<std::string> exit_reason_;
};

// -----------------------------------------------------------------------------
// InMemoryPositionRecordRepository
// -----------------------------------------------------------------------------
//
// @brief  Map of PositionId → record. Records are created on fill (or on
//         hydration) and kept after close so the exit audit trail survives
//         for the session.
//
// Sized for one intraday session: closed records accumulate until
// purgeClosed(), which RiskManager::stop() calls. A purged id is unknown to
// find(), which ExitCoordinator already reports as already_closed.
//
// Thread model:
//   create()/find()/closedRecords()/purgeClosed() are guarded by one
//   std::mutex. The map
//   lock is never held while a record lock is taken.
// -----------------------------------------------------------------------------
class InMemoryPositionRecordRepository final : public IPositionRecordRepository {
 public:
  InMemoryPositionRecordRepository() = default;

  InMemoryPositionRecordRepository(const InMemoryPositionRecordRepository&) =
      delete;
  InMemoryPositionRecordRepository& operator=(
      const InMemoryPositionRecordRepository&) = delete;

  // -------------------------------------------------------------------------
  // create(id)
  // -------------------------------------------------------------------------
  // @return The new record.
  // @throws std::invalid_argument if a record with this id already exists.
  // -------------------------------------------------------------------------
  std::shared_ptr<IPositionRecord> create(domain::PositionId id);

  std::shared_ptr<IPositionRecord> find(domain::PositionId id) const override;

  std::size_t size() const;

  // Ids of every record that has been closed, in ascending order.
  std::vector<domain::PositionId> closedRecords() const;

  // Drops every closed record. Returns how many were dropped.
  std::size_t purgeClosed();

 private:
  mutable std::mutex mutex_;
  std::unordered_map<domain::PositionId, std::shared_ptr<IPositionRecord>>
      records_;
};

}  // namespace optrisk
