#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// InstrumentKey: exchange segment + security id
// -----------------------------------------------------------------------------
//
// @brief  Identifies one tradable instrument (an option leg or an underlying
//         index) the way the tick feed addresses it.
//
// @details
// The broker feed publishes ticks keyed by {segment, security_id}, e.g.
// {"NSE_FNO", "43210"} for an option contract or {"IDX_I", "13"} for the
// NIFTY index. Both fields are required; a key with either field empty is
// considered malformed and is never indexed.
//
// composite() renders the key as "segment:security_id". This string form is
// what PositionStore indexes by and what the IPC telemetry reports.
// -----------------------------------------------------------------------------
struct InstrumentKey {
  std::string segment;       // Exchange segment (e.g. "NSE_FNO", "IDX_I")
  std::string security_id;   // Broker security id, always held as a string

  bool valid() const { return !segment.empty() && !security_id.empty(); }

  std::string composite() const { return segment + ":" + security_id; }

  bool operator==(const InstrumentKey& other) const {
    return segment == other.segment && security_id == other.security_id;
  }

  bool operator!=(const InstrumentKey& other) const {
    return !(*this == other);
  }
};

// Hash functor so InstrumentKey can key unordered containers directly.
struct InstrumentKeyHash {
  std::size_t operator()(const InstrumentKey& key) const {
    std::size_t h1 = std::hash<std::string>{}(key.segment);
    std::size_t h2 = std::hash<std::string>{}(key.security_id);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

}  // namespace domain
}  // namespace optrisk
