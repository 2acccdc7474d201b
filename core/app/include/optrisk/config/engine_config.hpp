#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace optrisk {
namespace config {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown by loadEngineConfig() / parseEngineConfig() when the file cannot be
// read, is not valid JSON, has a value of the wrong type, or violates one of
// the range checks in validate(). Startup aborts on it; nothing at runtime
// throws it.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// DrawdownConfig: upward (profit-protection) curve parameters
// -----------------------------------------------------------------------------
// allowed = dd_end + (dd_start − dd_end) · exp(−k · normalized)
// normalized maps [profit_min, profit_max] onto [0, 1].
// index_floors overrides the floor per instrument class; classes without an
// entry fall back to dd_end_pct.
// -----------------------------------------------------------------------------
struct DrawdownConfig {
  double profit_min{3.0};
  double profit_max{30.0};
  double dd_start_pct{15.0};
  double dd_end_pct{1.0};
  double exponential_k{3.0};
  std::map<std::string, double> index_floors;
};

// One row of the volatility penalty table: when volatility_ratio is at or
// below `threshold`, subtract `penalty_pct` from the allowed loss.
struct VolatilityPenalty {
  double threshold{0.0};
  double penalty_pct{0.0};
};

// -----------------------------------------------------------------------------
// ReverseLossConfig: downward (loss-tightening) curve parameters
// -----------------------------------------------------------------------------
// Disabled by default: with enabled == false the TrailingEngine never calls
// allowedDownwardLoss() and the static stop in HardLimitRule is the only
// downside exit. Penalties are scanned in order; the first match applies.
// -----------------------------------------------------------------------------
struct ReverseLossConfig {
  bool enabled{false};
  double max_loss_pct{20.0};
  double min_loss_pct{5.0};
  double loss_span_pct{30.0};
  double time_tighten_per_min{0.0};
  std::vector<VolatilityPenalty> volatility_penalties;
};

struct TrailingTier {
  double threshold_pct{0.0};
  double sl_offset_pct{0.0};
};

enum class TrailingMode {
  Tiered,    // tier table + peak-drawdown check
  Adaptive,  // DrawdownSchedule curve + fixed drop-from-HWM fallback
};

// -----------------------------------------------------------------------------
// TrailingConfig
// -----------------------------------------------------------------------------
//
// @details
// Tiered mode (default):
//   - TieredOffsetRule tightens sl_offset_pct from `tiers`.
//   - TrailingEngine exits when peak − current ≥ peak_drawdown_pct. With
//     gating_enabled it additionally requires peak ≥ activation_profit_pct
//     and the stored offset ≥ activation_sl_offset_pct.
//
// Adaptive mode:
//   - TrailingEngine exits when peak − current ≥ allowedUpwardDrawdown(peak),
//     falling back to a fixed drop of exit_drop_pct from the high-water-mark
//     (0 disables the fallback).
//
// Both modes lock breakeven once pnl_pct ≥ breakeven_after_gain_pct
// (0 disables).
// -----------------------------------------------------------------------------
struct TrailingConfig {
  TrailingMode mode{TrailingMode::Tiered};
  std::vector<TrailingTier> tiers{
      {5.0, -15.0},  {10.0, -5.0}, {15.0, 0.0},  {25.0, 10.0},
      {40.0, 20.0},  {60.0, 30.0}, {80.0, 40.0}, {120.0, 60.0},
  };
  double peak_drawdown_pct{5.0};
  bool gating_enabled{false};
  double activation_profit_pct{25.0};
  double activation_sl_offset_pct{10.0};
  double breakeven_after_gain_pct{5.0};
  double exit_drop_pct{0.0};
};

// Defaults applied to positions whose request carries no thresholds of its own.
struct HardLimitConfig {
  double default_sl_pct{30.0};
  double default_tp_pct{60.0};
  double max_loss_rupees{0.0};       // 0 disables the rupee hard SL
  double target_profit_rupees{0.0};  // 0 disables the rupee hard TP

  // SecureProfitRule: once pnl ≥ threshold, exit on a give-back of
  // secure_profit_drawdown_pct points from the peak.
  bool secure_profit_enabled{false};
  double secure_profit_threshold_rupees{1000.0};
  double secure_profit_drawdown_pct{3.0};
};

struct UnderlyingExitConfig {
  bool enabled{false};
  double trend_score_threshold{10.0};
  double atr_collapse_multiplier{0.65};
  std::int64_t max_staleness_ms{5000};
};

// -----------------------------------------------------------------------------
// SessionConfig: session-end forced exit
// -----------------------------------------------------------------------------
// exit_time is "HH:MM" in exchange local time; utc_offset_minutes converts
// the engine clock (UTC epoch ms) to local time (IST = +330).
// -----------------------------------------------------------------------------
struct SessionConfig {
  std::string exit_time{"15:20"};
  int utc_offset_minutes{330};
};

// Max holding time per instrument class. Disabled unless enabled == true.
struct TimeStopConfig {
  bool enabled{false};
  std::map<std::string, double> max_hold_minutes{
      {"NIFTY", 45.0}, {"BANKNIFTY", 45.0}, {"SENSEX", 90.0}};
  double default_max_hold_minutes{45.0};
};

struct SweepConfig {
  std::int64_t busy_interval_ms{500};
  std::int64_t idle_interval_ms{5000};
};

// Empty endpoint = that socket is not created.
struct NetworkConfig {
  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

enum class ClockMode {
  Live,
  Simulation,
};

// -----------------------------------------------------------------------------
// EngineConfig: everything RiskManager needs, loaded once at startup
// -----------------------------------------------------------------------------
//
// @brief  Aggregate of all tunables. Plain data, copied by value into the
//         components that need a section of it.
//
// @details
// Every key in the JSON file is optional; a missing key keeps the default
// shown above. An empty file ("{}") therefore yields a fully usable config.
//
// Thread model:
//   Immutable after load. Components hold their own copies; nothing reads the
//   config concurrently with a writer.
// -----------------------------------------------------------------------------
struct EngineConfig {
  DrawdownConfig drawdown;
  ReverseLossConfig reverse_loss;
  TrailingConfig trailing;
  HardLimitConfig hard_limits;
  UnderlyingExitConfig underlying_exit;
  SessionConfig session;
  TimeStopConfig time_stop;
  SweepConfig sweep;
  NetworkConfig network;
  ClockMode clock{ClockMode::Live};
};

// -----------------------------------------------------------------------------
// loadEngineConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads and parses a JSON config file.
// @throws ConfigError if the file is missing, malformed or out of range.
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

// -----------------------------------------------------------------------------
// parseEngineConfig(json_text)
// -----------------------------------------------------------------------------
// @brief  Same as loadEngineConfig() but from an in-memory JSON document.
// @throws ConfigError
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const std::string& json_text);

// -----------------------------------------------------------------------------
// validate(config)
// -----------------------------------------------------------------------------
// @brief  Range checks that keep the drawdown curves well defined:
//         profit_max > profit_min, dd_start ≥ dd_end > 0,
//         0 < min_loss ≤ max_loss, loss_span > 0, positive sweep intervals,
//         parseable session exit time.
// @throws ConfigError naming the first offending key.
// -----------------------------------------------------------------------------
void validate(const EngineConfig& config);

// -----------------------------------------------------------------------------
// parseHhmm("15:20") → minutes after midnight (920)
// -----------------------------------------------------------------------------
// @throws ConfigError on anything that is not a valid 24h HH:MM.
// -----------------------------------------------------------------------------
int parseHhmm(const std::string& hhmm);

}  // namespace config
}  // namespace optrisk
