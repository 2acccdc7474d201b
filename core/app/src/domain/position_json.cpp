#include "optrisk/domain/position_json.hpp"

#include <stdexcept>
#include <string>

namespace optrisk {
namespace domain {

namespace {

using nlohmann::json;

std::optional<double> optionalDouble(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

// security_id arrives as "43210" from some producers and 43210 from others.
std::string securityIdFromJson(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<std::int64_t>());
  }
  throw std::invalid_argument("security_id must be a string or an integer");
}

Side sideFromString(const std::string& s) {
  if (s == "BUY" || s == "buy" || s == "Buy") {
    return Side::Buy;
  }
  if (s == "SELL" || s == "sell" || s == "Sell") {
    return Side::Sell;
  }
  throw std::invalid_argument("side must be BUY or SELL, got '" + s + "'");
}

Direction directionFromString(const std::string& s) {
  if (s == "bullish") {
    return Direction::Bullish;
  }
  if (s == "bearish") {
    return Direction::Bearish;
  }
  if (s == "neutral") {
    return Direction::Neutral;
  }
  throw std::invalid_argument("direction must be bullish or bearish, got '" +
                              s + "'");
}

ExitThresholds thresholdsFromJson(const json& j) {
  ExitThresholds t;
  t.sl_price = optionalDouble(j, "sl_price");
  t.tp_price = optionalDouble(j, "tp_price");
  t.sl_pct = optionalDouble(j, "sl_pct");
  t.tp_pct = optionalDouble(j, "tp_pct");
  t.max_loss_rupees = optionalDouble(j, "max_loss_rupees");
  t.target_profit_rupees = optionalDouble(j, "target_profit_rupees");
  return t;
}

void putOptional(json& j, const char* key, const std::optional<double>& v) {
  if (v) {
    j[key] = *v;
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// instrumentKeyFromJson
// -----------------------------------------------------------------------------
InstrumentKey instrumentKeyFromJson(const json& j) {
  InstrumentKey key;
  key.segment = j.at("segment").get<std::string>();
  key.security_id = securityIdFromJson(j.at("security_id"));
  return key;
}

// -----------------------------------------------------------------------------
// positionRequestFromJson
// -----------------------------------------------------------------------------
PositionRequest positionRequestFromJson(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("position must be a JSON object");
  }

  try {
    PositionRequest req;
    req.instrument = instrumentKeyFromJson(j);
    req.index_key = j.value("index_key", std::string{});
    req.side = sideFromString(j.value("side", std::string{"BUY"}));
    req.direction =
        directionFromString(j.value("direction", std::string{"bullish"}));
    req.entry_price = j.at("entry_price").get<double>();
    req.quantity = j.at("quantity").get<double>();
    req.thresholds = thresholdsFromJson(j);

    auto it = j.find("underlying");
    if (it != j.end() && it->is_object()) {
      req.underlying = instrumentKeyFromJson(*it);
    }
    return req;
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("invalid position: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// positionFromJson: request fields plus persisted state
// -----------------------------------------------------------------------------
Position positionFromJson(const json& j) {
  PositionRequest req = positionRequestFromJson(j);

  try {
    Position pos;
    pos.id = j.at("id").get<PositionId>();
    pos.instrument = std::move(req.instrument);
    pos.index_key = std::move(req.index_key);
    pos.side = req.side;
    pos.direction = req.direction;
    pos.entry_price = req.entry_price;
    pos.quantity = req.quantity;
    pos.thresholds = req.thresholds;
    pos.underlying = std::move(req.underlying);

    pos.opened_at_ms = j.value("opened_at_ms", std::int64_t{0});
    pos.peak_profit_pct = j.value("peak_profit_pct", 0.0);
    pos.high_water_mark = j.value("high_water_mark", 0.0);
    pos.sl_offset_pct = optionalDouble(j, "sl_offset_pct");
    pos.breakeven_locked = j.value("breakeven_locked", false);
    return pos;
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("invalid position: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// positionToJson
// -----------------------------------------------------------------------------
json positionToJson(const Position& p) {
  json j;
  j["id"] = p.id;
  j["segment"] = p.instrument.segment;
  j["security_id"] = p.instrument.security_id;
  j["index_key"] = p.index_key;
  j["side"] = sideToString(p.side);
  j["direction"] = directionToString(p.direction);
  j["status"] = statusToString(p.status);
  j["entry_price"] = p.entry_price;
  j["quantity"] = p.quantity;
  j["ltp"] = p.ltp;
  j["pnl"] = p.pnl;
  j["pnl_pct"] = p.pnl_pct;
  j["peak_profit_pct"] = p.peak_profit_pct;
  j["high_water_mark"] = p.high_water_mark;
  j["breakeven_locked"] = p.breakeven_locked;
  j["opened_at_ms"] = p.opened_at_ms;
  j["last_update_ms"] = p.last_update_ms;

  if (p.sl_offset_pct) {
    j["sl_offset_pct"] = *p.sl_offset_pct;
  } else {
    j["sl_offset_pct"] = nullptr;
  }
  if (p.underwater_since_ms) {
    j["underwater_since_ms"] = *p.underwater_since_ms;
  }
  if (p.underlying) {
    j["underlying"] = {{"segment", p.underlying->segment},
                       {"security_id", p.underlying->security_id}};
  }

  putOptional(j, "sl_price", p.thresholds.sl_price);
  putOptional(j, "tp_price", p.thresholds.tp_price);
  putOptional(j, "sl_pct", p.thresholds.sl_pct);
  putOptional(j, "tp_pct", p.thresholds.tp_pct);
  putOptional(j, "max_loss_rupees", p.thresholds.max_loss_rupees);
  putOptional(j, "target_profit_rupees", p.thresholds.target_profit_rupees);
  return j;
}

const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "Unknown";
}

const char* directionToString(Direction direction) {
  switch (direction) {
    case Direction::Neutral: return "neutral";
    case Direction::Bullish: return "bullish";
    case Direction::Bearish: return "bearish";
  }
  return "unknown";
}

const char* statusToString(PositionStatus status) {
  switch (status) {
    case PositionStatus::Open:    return "Open";
    case PositionStatus::Exiting: return "Exiting";
    case PositionStatus::Closed:  return "Closed";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace optrisk
