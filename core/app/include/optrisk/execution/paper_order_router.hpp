#pragma once

#include "optrisk/execution/i_order_router.hpp"

namespace optrisk {

// -----------------------------------------------------------------------------
// PaperOrderRouter: deterministic simulated exits
// -----------------------------------------------------------------------------
//
// @brief  Fills every exit immediately at the last traded price, with zero
//         slippage. Used by the optrisk binary (paper trading) and the
//         end-to-end tests.
//
// @details
// Fill price: the reference price ExitCoordinator resolved (position ltp,
// else last cached price, else entry). A non-positive reference price is
// rejected with an error.
//
// Thread model:
//   Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class PaperOrderRouter final : public IOrderRouter {
 public:
  ExitOrderResult exitMarket(const domain::Position& position,
                             double reference_price) override;
};

}  // namespace optrisk
