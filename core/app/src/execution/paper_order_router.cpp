#include "optrisk/execution/paper_order_router.hpp"

#include <iostream>

namespace optrisk {

// -----------------------------------------------------------------------------
// exitMarket: immediate fill at the reference price
// -----------------------------------------------------------------------------
ExitOrderResult PaperOrderRouter::exitMarket(const domain::Position& position,
                                             double reference_price) {
  ExitOrderResult result;

  if (!(reference_price > 0.0)) {
    result.error = "no price for " + position.instrument.composite();
    return result;
  }

  result.success = true;
  result.fill_price = reference_price;

  std::cout << "[PaperOrderRouter] " << (position.side == domain::Side::Buy
                                             ? "SELL "
                                             : "BUY ")
            << position.quantity << " " << position.instrument.composite()
            << " @ " << reference_price << "\n";
  return result;
}

}  // namespace optrisk
