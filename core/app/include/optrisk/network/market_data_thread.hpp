#pragma once

#include "optrisk/events/event.hpp"
#include "optrisk/gateway/market_data_gateway.hpp"
#include "optrisk/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace optrisk {

// -----------------------------------------------------------------------------
// MarketDataThread: owns the gateway and the thread running its recv loop
// -----------------------------------------------------------------------------
//
// @brief  RAII wrapper: start() connects the SUB socket and spawns the thread,
//         stop() signals the gateway and joins.
//
// @details
// The gateway is created inside start(), not in the constructor, so
// RiskManager can build this object before hydration and only connect once
// the store is ready to receive ticks.
//
// Thread model:
//   start()/stop() from the owning thread. The spawned thread runs
//   MarketDataGateway::run() and nothing else.
//
// Ownership:
//   Owned by RiskManager via std::unique_ptr. Owns the gateway.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataThread(SimulationTimeProvider* sim_clock, EventSink event_sink,
                   std::string endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  void start();
  void stop();

 private:
  SimulationTimeProvider* sim_clock_;
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace optrisk
