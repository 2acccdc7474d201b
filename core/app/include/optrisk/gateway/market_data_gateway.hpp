#pragma once

#include "optrisk/events/event.hpp"
#include "optrisk/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <optional>
#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// MarketDataGateway: ZeroMQ SUB bridge for the tick feed
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON messages on a SUB socket, decodes them into TickEvent
//         or UnderlyingStateEvent, and hands each one to the event sink.
//
// @details
// Two message shapes share the feed:
//
//   Tick:
//     {"segment": "NSE_FNO", "security_id": "43210",
//      "last_price": 112.5, "timestamp": 1700000000000}
//
//   Underlying snapshot:
//     {"type": "underlying_state", "segment": "IDX_I", "security_id": 13,
//      "trend_score": 14.0, "structure_state": "intact|broken",
//      "structure_direction": "bullish|bearish|neutral",
//      "volatility_trend": "falling|flat|rising", "volatility_ratio": 0.9,
//      "timestamp": 1700000000000}
//
// security_id may be a JSON string or integer. timestamp is epoch ms and
// optional (0 = let the consumer stamp it with its clock). Anything that does
// not decode is logged and dropped; the loop keeps running.
//
// When constructed with a SimulationTimeProvider the clock is advanced to the
// message timestamp BEFORE the sink runs, so everything the sink triggers
// reads the tick's time.
//
// The sink runs synchronously on the gateway thread. RiskManager binds it to
// the tick bus, so the tick path is recv → parse → PositionStore::onTick.
//
// Thread model:
//   run() blocks; call it from a dedicated thread (MarketDataThread). stop()
//   from any thread. ZMQ_RCVTIMEO bounds how long stop() takes to be seen.
//
// Ownership:
//   Owns the ZMQ context and socket. Borrows the simulation clock (nullable).
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using EventSink = std::function<void(Event)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  sim_clock   Simulation clock to advance per message, or nullptr
  //                     in live mode.
  // @param  event_sink  Receives each decoded event.
  // @param  endpoint    Publisher endpoint to connect to.
  // -------------------------------------------------------------------------
  MarketDataGateway(SimulationTimeProvider* sim_clock, EventSink event_sink,
                    const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // parseMessage(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one feed message.
  // @return TickEvent or UnderlyingStateEvent, std::nullopt if malformed
  //         (the reason is logged).
  // -------------------------------------------------------------------------
  static std::optional<Event> parseMessage(const std::string& payload);


 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulationTimeProvider* sim_clock_;
  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
};

}  // namespace optrisk
