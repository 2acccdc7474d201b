#include "optrisk/rules/underlying_exit_rule.hpp"

#include <utility>

namespace optrisk {

namespace {

bool brokeAgainst(domain::Direction position_direction,
                  domain::Direction break_direction) {
  using domain::Direction;
  return (position_direction == Direction::Bullish &&
          break_direction == Direction::Bearish) ||
         (position_direction == Direction::Bearish &&
          break_direction == Direction::Bullish);
}

}  // namespace

UnderlyingExitRule::UnderlyingExitRule(config::UnderlyingExitConfig config)
    : config_(std::move(config)) {}

Decision UnderlyingExitRule::evaluate(const domain::Position& position,
                                      const RuleContext& context) {
  if (!position.underlying || context.underlying == nullptr) {
    return Decision::noAction();
  }

  auto state = context.underlying->latest(*position.underlying);
  if (!state) {
    return Decision::noAction();
  }

  if (state->structure_state == domain::StructureState::Broken &&
      brokeAgainst(position.direction, state->structure_direction)) {
    return Decision::exit("underlying_structure_break", name_);
  }

  if (state->trend_score &&
      *state->trend_score < config_.trend_score_threshold) {
    return Decision::exit("underlying_trend_weak", name_);
  }

  if (state->volatility_trend == domain::VolatilityTrend::Falling &&
      state->volatility_ratio &&
      *state->volatility_ratio < config_.atr_collapse_multiplier) {
    return Decision::exit("underlying_atr_collapse", name_);
  }

  return Decision::noAction();
}

}  // namespace optrisk
