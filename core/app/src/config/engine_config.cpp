#include "optrisk/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace optrisk {
namespace config {

namespace {

using nlohmann::json;

// Reads `key` into `out` when present. A present key with the wrong type
// throws nlohmann::json::type_error, which the caller converts to ConfigError.
template <typename T>
void readOptional(const json& section, const char* key, T& out) {
  auto it = section.find(key);
  if (it != section.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

const json& sectionOrEmpty(const json& root, const char* key) {
  static const json kEmpty = json::object();
  auto it = root.find(key);
  if (it == root.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("section '") + key + "' must be an object");
  }
  return *it;
}

void parseDrawdown(const json& j, DrawdownConfig& c) {
  readOptional(j, "profit_min", c.profit_min);
  readOptional(j, "profit_max", c.profit_max);
  readOptional(j, "dd_start_pct", c.dd_start_pct);
  readOptional(j, "dd_end_pct", c.dd_end_pct);
  readOptional(j, "exponential_k", c.exponential_k);
  readOptional(j, "index_floors", c.index_floors);
}

void parseReverseLoss(const json& j, ReverseLossConfig& c) {
  readOptional(j, "enabled", c.enabled);
  readOptional(j, "max_loss_pct", c.max_loss_pct);
  readOptional(j, "min_loss_pct", c.min_loss_pct);
  readOptional(j, "loss_span_pct", c.loss_span_pct);
  readOptional(j, "time_tighten_per_min", c.time_tighten_per_min);

  auto it = j.find("atr_penalty_thresholds");
  if (it != j.end() && it->is_array()) {
    c.volatility_penalties.clear();
    for (const auto& row : *it) {
      VolatilityPenalty p;
      p.threshold = row.at("threshold").get<double>();
      p.penalty_pct = row.at("penalty_pct").get<double>();
      c.volatility_penalties.push_back(p);
    }
  }
}

void parseTrailing(const json& j, TrailingConfig& c) {
  std::string mode;
  readOptional(j, "mode", mode);
  if (mode == "adaptive") {
    c.mode = TrailingMode::Adaptive;
  } else if (mode == "tiered") {
    c.mode = TrailingMode::Tiered;
  } else if (!mode.empty()) {
    throw ConfigError("trailing.mode must be 'tiered' or 'adaptive', got '" +
                      mode + "'");
  }

  auto it = j.find("tiers");
  if (it != j.end() && it->is_array() && !it->empty()) {
    c.tiers.clear();
    for (const auto& row : *it) {
      TrailingTier tier;
      tier.threshold_pct = row.at("trigger_pct").get<double>();
      tier.sl_offset_pct = row.at("sl_offset_pct").get<double>();
      c.tiers.push_back(tier);
    }
  }

  readOptional(j, "peak_drawdown_exit_pct", c.peak_drawdown_pct);
  readOptional(j, "enable_peak_drawdown_activation", c.gating_enabled);
  readOptional(j, "activation_profit_pct", c.activation_profit_pct);
  readOptional(j, "activation_sl_offset_pct", c.activation_sl_offset_pct);
  readOptional(j, "breakeven_after_gain_pct", c.breakeven_after_gain_pct);
  readOptional(j, "exit_drop_pct", c.exit_drop_pct);
}

void parseHardLimits(const json& j, HardLimitConfig& c) {
  readOptional(j, "sl_pct", c.default_sl_pct);
  readOptional(j, "tp_pct", c.default_tp_pct);
  readOptional(j, "max_loss_rupees", c.max_loss_rupees);
  readOptional(j, "target_profit_rupees", c.target_profit_rupees);
  readOptional(j, "secure_profit_enabled", c.secure_profit_enabled);
  readOptional(j, "secure_profit_threshold_rupees",
               c.secure_profit_threshold_rupees);
  readOptional(j, "secure_profit_drawdown_pct", c.secure_profit_drawdown_pct);
}

void parseUnderlying(const json& j, UnderlyingExitConfig& c) {
  readOptional(j, "enabled", c.enabled);
  readOptional(j, "trend_score_threshold", c.trend_score_threshold);
  readOptional(j, "atr_collapse_multiplier", c.atr_collapse_multiplier);
  readOptional(j, "max_staleness_ms", c.max_staleness_ms);
}

void parseSession(const json& j, SessionConfig& c) {
  readOptional(j, "exit_time", c.exit_time);
  readOptional(j, "utc_offset_minutes", c.utc_offset_minutes);
}

void parseTimeStop(const json& j, TimeStopConfig& c) {
  readOptional(j, "enabled", c.enabled);
  readOptional(j, "max_hold_minutes", c.max_hold_minutes);
  readOptional(j, "default_max_hold_minutes", c.default_max_hold_minutes);
}

void parseSweep(const json& j, SweepConfig& c) {
  readOptional(j, "busy_interval_ms", c.busy_interval_ms);
  readOptional(j, "idle_interval_ms", c.idle_interval_ms);
}

void parseNetwork(const json& j, NetworkConfig& c) {
  readOptional(j, "market_data_endpoint", c.market_data_endpoint);
  readOptional(j, "ipc_cmd_endpoint", c.ipc_cmd_endpoint);
  readOptional(j, "ipc_pub_endpoint", c.ipc_pub_endpoint);
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig: JSON text → EngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const std::string& json_text) {
  EngineConfig config;

  try {
    json root = json::parse(json_text);
    if (!root.is_object()) {
      throw ConfigError("config root must be a JSON object");
    }

    parseDrawdown(sectionOrEmpty(root, "drawdown"), config.drawdown);
    parseReverseLoss(sectionOrEmpty(root, "reverse_loss"), config.reverse_loss);
    parseTrailing(sectionOrEmpty(root, "trailing"), config.trailing);
    parseHardLimits(sectionOrEmpty(root, "hard_limits"), config.hard_limits);
    parseUnderlying(sectionOrEmpty(root, "underlying_exit"),
                    config.underlying_exit);
    parseSession(sectionOrEmpty(root, "session"), config.session);
    parseTimeStop(sectionOrEmpty(root, "time_stop"), config.time_stop);
    parseSweep(sectionOrEmpty(root, "sweep"), config.sweep);
    parseNetwork(sectionOrEmpty(root, "network"), config.network);

    std::string clock;
    readOptional(root, "clock", clock);
    if (clock == "simulation") {
      config.clock = ClockMode::Simulation;
    } else if (clock == "live" || clock.empty()) {
      config.clock = ClockMode::Live;
    } else {
      throw ConfigError("clock must be 'live' or 'simulation', got '" + clock +
                        "'");
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }

  validate(config);
  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig: file → EngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

// -----------------------------------------------------------------------------
// validate: range checks
// -----------------------------------------------------------------------------
void validate(const EngineConfig& config) {
  const auto& dd = config.drawdown;
  if (dd.profit_max <= dd.profit_min) {
    throw ConfigError("drawdown.profit_max must be greater than profit_min");
  }
  if (dd.dd_end_pct <= 0.0) {
    throw ConfigError("drawdown.dd_end_pct must be positive");
  }
  if (dd.dd_start_pct < dd.dd_end_pct) {
    throw ConfigError("drawdown.dd_start_pct must be >= dd_end_pct");
  }
  if (dd.exponential_k < 0.0) {
    throw ConfigError("drawdown.exponential_k must be >= 0");
  }

  const auto& rl = config.reverse_loss;
  if (rl.min_loss_pct <= 0.0) {
    throw ConfigError("reverse_loss.min_loss_pct must be positive");
  }
  if (rl.min_loss_pct > rl.max_loss_pct) {
    throw ConfigError("reverse_loss.min_loss_pct must be <= max_loss_pct");
  }
  if (rl.loss_span_pct <= 0.0) {
    throw ConfigError("reverse_loss.loss_span_pct must be positive");
  }
  if (rl.time_tighten_per_min < 0.0) {
    throw ConfigError("reverse_loss.time_tighten_per_min must be >= 0");
  }
  for (const auto& row : rl.volatility_penalties) {
    if (row.penalty_pct < 0.0) {
      throw ConfigError("reverse_loss volatility penalty_pct must be >= 0");
    }
  }

  if (config.trailing.peak_drawdown_pct <= 0.0) {
    throw ConfigError("trailing.peak_drawdown_exit_pct must be positive");
  }

  const auto& hl = config.hard_limits;
  if (hl.secure_profit_threshold_rupees < 0.0) {
    throw ConfigError(
        "hard_limits.secure_profit_threshold_rupees must be >= 0");
  }
  if (hl.secure_profit_drawdown_pct <= 0.0) {
    throw ConfigError("hard_limits.secure_profit_drawdown_pct must be positive");
  }

  if (config.sweep.busy_interval_ms <= 0 || config.sweep.idle_interval_ms <= 0) {
    throw ConfigError("sweep intervals must be positive");
  }

  parseHhmm(config.session.exit_time);
}

// -----------------------------------------------------------------------------
// parseHhmm: "HH:MM" → minutes after midnight
// -----------------------------------------------------------------------------
int parseHhmm(const std::string& hhmm) {
  auto colon = hhmm.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= hhmm.size()) {
    throw ConfigError("expected HH:MM, got '" + hhmm + "'");
  }

  int hours = 0;
  int minutes = 0;
  try {
    std::size_t used_h = 0;
    std::size_t used_m = 0;
    hours = std::stoi(hhmm.substr(0, colon), &used_h);
    minutes = std::stoi(hhmm.substr(colon + 1), &used_m);
    if (used_h != colon || used_m != hhmm.size() - colon - 1) {
      throw ConfigError("expected HH:MM, got '" + hhmm + "'");
    }
  } catch (const std::logic_error&) {
    throw ConfigError("expected HH:MM, got '" + hhmm + "'");
  }

  if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
    throw ConfigError("time out of range: '" + hhmm + "'");
  }
  return hours * 60 + minutes;
}

}  // namespace config
}  // namespace optrisk
