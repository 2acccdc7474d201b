#pragma once

#include "optrisk/domain/position.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// IPositionRecord: the persisted side of a position
// -----------------------------------------------------------------------------
//
// @brief  The record that makes the open → closed transition durable and
//         unique. ExitCoordinator is its only writer.
//
// @details
// In a deployment backed by a database this would wrap a row and its row
// lock; the in-process implementation wraps a mutex. Either way the contract
// is the same:
//
//   withExclusiveLock(fn)  runs fn while holding the record's exclusive lock.
//                          Anything else that mutates the record (an external
//                          updater, a manual exit) takes the same lock, so a
//                          check-then-act inside fn cannot interleave.
//   closed()               true once markClosed() has succeeded.
//   markClosed(p, reason)  terminal. A second call throws std::logic_error;
//                          exactly one exit price and reason are recorded.
//
// Lock re-entrancy: closed() and markClosed() may be called from inside fn on
// the same thread. Implementations must allow that (recursive lock or an
// unlocked fast path).
// -----------------------------------------------------------------------------
class IPositionRecord {
 public:
  virtual ~IPositionRecord() = default;

  virtual domain::PositionId id() const = 0;

  virtual void withExclusiveLock(const std::function<void()>& fn) = 0;

  virtual bool closed() const = 0;

  // @throws std::logic_error if the record is already closed.
  virtual void markClosed(double exit_price, const std::string& reason) = 0;

  virtual std::optional<double> exitPrice() const = 0;
  virtual std::optional<std::string> exitReason() const = 0;
};

// -----------------------------------------------------------------------------
// IPositionRecordRepository: lookup of records by position id
// -----------------------------------------------------------------------------
// find() returns nullptr for unknown ids. Records are shared: ExitCoordinator
// keeps its reference alive for the duration of one exit even if the
// repository drops it concurrently.
// -----------------------------------------------------------------------------
class IPositionRecordRepository {
 public:
  virtual ~IPositionRecordRepository() = default;

  virtual std::shared_ptr<IPositionRecord> find(domain::PositionId id) const = 0;
};

}  // namespace optrisk
