#pragma once

#include "optrisk/domain/position.hpp"

#include <optional>
#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// ExitOrderResult
// -----------------------------------------------------------------------------
// success      true once the broker confirmed the exit order.
// fill_price   average fill, when the broker reported one. Absent means
//              ExitCoordinator records its own resolved price instead.
// error        broker message on failure.
// -----------------------------------------------------------------------------
struct ExitOrderResult {
  bool success{false};
  std::optional<double> fill_price;
  std::string error;
};

// -----------------------------------------------------------------------------
// IOrderRouter: broker-facing exit order interface
// -----------------------------------------------------------------------------
//
// @brief  Sends the market order that flattens a position.
//
// @details
// Order placement, retries and broker wire protocol live behind this
// interface. The engine only needs one operation: close this leg at market.
// The router receives the position snapshot taken under the record lock,
// so side and quantity are the ones being closed, together with the
// coordinator's resolved exit price (ltp, else cached price, else entry).
// Live routers ignore it for market orders; simulated routers fill at it.
//
// Failure reporting: either return success == false with an error, or throw
// a std::exception. ExitCoordinator treats both identically: the position
// stays open and the next sweep re-runs the full rule chain.
//
// Thread model:
//   Called on the sweep thread, or on the IPC thread for manual exits. Never
//   concurrently for the same position (the record lock is held).
// -----------------------------------------------------------------------------
class IOrderRouter {
 public:
  virtual ~IOrderRouter() = default;

  virtual ExitOrderResult exitMarket(const domain::Position& position,
                                     double reference_price) = 0;
};

}  // namespace optrisk
