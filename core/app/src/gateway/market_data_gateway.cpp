#include "optrisk/gateway/market_data_gateway.hpp"
#include "optrisk/domain/position_json.hpp"
#include "optrisk/events/event_types.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace optrisk {

namespace {

using nlohmann::json;

domain::StructureState structureFromString(const std::string& s) {
  if (s == "intact") return domain::StructureState::Intact;
  if (s == "broken") return domain::StructureState::Broken;
  return domain::StructureState::Unknown;
}

domain::Direction directionFromString(const std::string& s) {
  if (s == "bullish") return domain::Direction::Bullish;
  if (s == "bearish") return domain::Direction::Bearish;
  return domain::Direction::Neutral;
}

domain::VolatilityTrend volatilityFromString(const std::string& s) {
  if (s == "falling") return domain::VolatilityTrend::Falling;
  if (s == "flat") return domain::VolatilityTrend::Flat;
  if (s == "rising") return domain::VolatilityTrend::Rising;
  return domain::VolatilityTrend::Unknown;
}

std::optional<double> optionalNumber(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

std::int64_t timestampOf(const json& j) {
  return j.value("timestamp", std::int64_t{0});
}

Event decodeUnderlying(const json& j) {
  UnderlyingStateEvent event;
  auto& s = event.state;
  s.underlying = domain::instrumentKeyFromJson(j);
  s.trend_score = optionalNumber(j, "trend_score");
  s.structure_state =
      structureFromString(j.value("structure_state", std::string{}));
  s.structure_direction =
      directionFromString(j.value("structure_direction", std::string{}));
  s.volatility_trend =
      volatilityFromString(j.value("volatility_trend", std::string{}));
  s.volatility_ratio = optionalNumber(j, "volatility_ratio");
  s.observed_at_ms = timestampOf(j);
  return event;
}

Event decodeTick(const json& j) {
  TickEvent tick;
  tick.instrument = domain::instrumentKeyFromJson(j);
  tick.last_price = j.at("last_price").get<double>();
  tick.timestamp_ms = timestampOf(j);
  return tick;
}

std::int64_t eventTimestamp(const Event& event) {
  if (const auto* tick = std::get_if<TickEvent>(&event)) {
    return tick->timestamp_ms;
  }
  if (const auto* state = std::get_if<UnderlyingStateEvent>(&event)) {
    return state->state.observed_at_ms;
  }
  return 0;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe to everything, bounded recv
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(SimulationTimeProvider* sim_clock,
                                     EventSink event_sink,
                                     const std::string& endpoint)
    : sim_clock_(sim_clock), event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);

  // Armed here rather than in run() so a stop() issued before the thread
  // reaches run() is not overwritten.
  running_.store(true);
}

// -----------------------------------------------------------------------------
// parseMessage(): JSON → TickEvent | UnderlyingStateEvent
// -----------------------------------------------------------------------------
std::optional<Event> MarketDataGateway::parseMessage(
    const std::string& payload) {
  try {
    auto j = json::parse(payload);
    if (!j.is_object()) {
      std::cerr << "[MarketDataGateway] Dropping non-object message: "
                << payload << "\n";
      return std::nullopt;
    }

    if (j.value("type", std::string{}) == "underlying_state") {
      return decodeUnderlying(j);
    }
    return decodeTick(j);
  } catch (const json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON error: " << e.what()
              << " payload: " << payload << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[MarketDataGateway] Bad message: " << e.what()
              << " payload: " << payload << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// run(): recv → parse → advance clock → sink
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;
    }

    auto event = parseMessage(msg.to_string());
    if (!event) {
      continue;  // already logged by parseMessage
    }

    std::int64_t ts = eventTimestamp(*event);
    if (sim_clock_ != nullptr && ts > 0) {
      sim_clock_->advance_time(ts);
    }

    event_sink_(std::move(*event));
  }
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace optrisk
