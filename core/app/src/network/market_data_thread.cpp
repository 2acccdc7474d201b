#include "optrisk/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace optrisk {

MarketDataThread::MarketDataThread(SimulationTimeProvider* sim_clock,
                                   EventSink event_sink, std::string endpoint)
    : sim_clock_(sim_clock),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)) {}

MarketDataThread::~MarketDataThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create gateway and spawn recv thread
// -----------------------------------------------------------------------------
void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ =
      std::make_unique<MarketDataGateway>(sim_clock_, event_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[MarketDataThread] recv loop exited.\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal gateway and join thread
// -----------------------------------------------------------------------------
void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace optrisk
