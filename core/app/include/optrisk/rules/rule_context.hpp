#pragma once

#include "optrisk/risk/i_underlying_state_provider.hpp"

#include <cstdint>

namespace optrisk {

// -----------------------------------------------------------------------------
// RuleContext: per-pass inputs shared by every rule
// -----------------------------------------------------------------------------
// Built once per sweep pass by RiskManager so every position in the pass sees
// the same "now". underlying may be null when no provider is wired (tests);
// rules treat that like a missing snapshot.
// -----------------------------------------------------------------------------
struct RuleContext {
  std::int64_t now_ms{0};
  const IUnderlyingStateProvider* underlying{nullptr};
};

}  // namespace optrisk
