#include "optrisk/risk/in_memory_position_record.hpp"

#include <algorithm>
#include <stdexcept>

namespace optrisk {

// -----------------------------------------------------------------------------
// InMemoryPositionRecord
// -----------------------------------------------------------------------------
void InMemoryPositionRecord::withExclusiveLock(const std::function<void()>& fn) {
  std::lock_guard lock(mutex_);
  fn();
}

bool InMemoryPositionRecord::closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

void InMemoryPositionRecord::markClosed(double exit_price,
                                        const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (closed_) {
    throw std::logic_error("position " + std::to_string(id_) +
                           " already closed (" + exit_reason_.value_or("") +
                           ")");
  }
  closed_ = true;
  exit_price_ = exit_price;
  exit_reason_ = reason;
}

std::optional<double> InMemoryPositionRecord::exitPrice() const {
  std::lock_guard lock(mutex_);
  return exit_price_;
}

std::optional<std::string> InMemoryPositionRecord::exitReason() const {
  std::lock_guard lock(mutex_);
  return exit_reason_;
}

// -----------------------------------------------------------------------------
// InMemoryPositionRecordRepository
// -----------------------------------------------------------------------------
std::shared_ptr<IPositionRecord> InMemoryPositionRecordRepository::create(
    domain::PositionId id) {
  std::lock_guard lock(mutex_);
  auto [it, inserted] =
      records_.emplace(id, std::make_shared<InMemoryPositionRecord>(id));
  if (!inserted) {
    throw std::invalid_argument("record for position " + std::to_string(id) +
                                " already exists");
  }
  return it->second;
}

std::shared_ptr<IPositionRecord> InMemoryPositionRecordRepository::find(
    domain::PositionId id) const {
  std::lock_guard lock(mutex_);
  auto it = records_.find(id);
  return it != records_.end() ? it->second : nullptr;
}

std::size_t InMemoryPositionRecordRepository::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

std::vector<domain::PositionId>
InMemoryPositionRecordRepository::closedRecords() const {
  // Copy the pointers first; record locks are taken after the map lock is
  // released.
  std::vector<std::shared_ptr<IPositionRecord>> records;
  {
    std::lock_guard lock(mutex_);
    records.reserve(records_.size());
    for (const auto& [id, record] : records_) {
      records.push_back(record);
    }
  }

  std::vector<domain::PositionId> ids;
  for (const auto& record : records) {
    if (record->closed()) {
      ids.push_back(record->id());
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::size_t InMemoryPositionRecordRepository::purgeClosed() {
  // A closed record never reopens, so ids found closed here stay closed
  // until they are erased below.
  auto closed = closedRecords();

  std::lock_guard lock(mutex_);
  for (auto id : closed) {
    records_.erase(id);
  }
  return closed.size();
}

}  // namespace optrisk
