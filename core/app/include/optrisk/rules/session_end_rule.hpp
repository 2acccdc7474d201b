#pragma once

#include "optrisk/config/engine_config.hpp"
#include "optrisk/rules/i_exit_rule.hpp"

namespace optrisk {

// -----------------------------------------------------------------------------
// SessionEndRule: flat by the cutoff, and optional max holding time
// -----------------------------------------------------------------------------
//
// @details
// Intraday only: every position is closed once local time reaches
// session.exit_time (default 15:20 IST, ten minutes before the close) →
// session_end_exit. Runs last so a position already hitting a price rule
// reports that reason instead.
//
// With time_stop.enabled, a position held longer than the limit for its
// instrument class (NIFTY/BANKNIFTY 45 min, SENSEX 90 min by default) exits
// with time_stop.
//
// Does not depend on price, so it fires even for a position that never
// received a tick.
// -----------------------------------------------------------------------------
class SessionEndRule final : public IExitRule {
 public:
  // @throws config::ConfigError if session.exit_time is not HH:MM.
  SessionEndRule(config::SessionConfig session, config::TimeStopConfig time_stop);

  Decision evaluate(const domain::Position& position,
                    const RuleContext& context) override;

  const std::string& name() const override { return name_; }

  int exitMinuteOfDay() const { return exit_minute_; }

 private:
  double maxHoldMinutes(const std::string& instrument_class) const;

  const config::SessionConfig session_;
  const config::TimeStopConfig time_stop_;
  const int exit_minute_;
  const std::string name_{"SessionEndRule"};
};

}  // namespace optrisk
