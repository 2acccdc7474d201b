#include "optrisk/rules/session_end_rule.hpp"
#include "optrisk/time/time_utils.hpp"

#include <utility>

namespace optrisk {

SessionEndRule::SessionEndRule(config::SessionConfig session,
                               config::TimeStopConfig time_stop)
    : session_(std::move(session)),
      time_stop_(std::move(time_stop)),
      exit_minute_(config::parseHhmm(session_.exit_time)) {}

double SessionEndRule::maxHoldMinutes(
    const std::string& instrument_class) const {
  auto it = time_stop_.max_hold_minutes.find(instrument_class);
  if (it != time_stop_.max_hold_minutes.end()) {
    return it->second;
  }
  return time_stop_.default_max_hold_minutes;
}

Decision SessionEndRule::evaluate(const domain::Position& position,
                                  const RuleContext& context) {
  int minute = local_minute_of_day(context.now_ms, session_.utc_offset_minutes);
  if (minute >= exit_minute_) {
    return Decision::exit("session_end_exit", name_);
  }

  if (time_stop_.enabled) {
    double limit_minutes = maxHoldMinutes(position.index_key);
    double held_minutes =
        seconds_between(position.opened_at_ms, context.now_ms) / 60.0;
    if (limit_minutes > 0.0 && held_minutes >= limit_minutes) {
      return Decision::exit("time_stop", name_);
    }
  }

  return Decision::noAction();
}

}  // namespace optrisk
