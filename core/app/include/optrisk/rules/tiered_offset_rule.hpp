#pragma once

#include "optrisk/risk/trailing_engine.hpp"
#include "optrisk/rules/i_exit_rule.hpp"

namespace optrisk {

// -----------------------------------------------------------------------------
// TieredOffsetRule: ratchets the trailing SL offset up the tier table
// -----------------------------------------------------------------------------
// Never exits. Delegates to TrailingEngine::applyTieredOffset and always
// returns NoAction; the new offset is enforced by HardLimitRule (and the
// peak-drawdown gate) from the next sweep pass on. Enabled in tiered mode.
// -----------------------------------------------------------------------------
class TieredOffsetRule final : public IExitRule {
 public:
  explicit TieredOffsetRule(TrailingEngine& trailing) : trailing_(trailing) {}

  Decision evaluate(const domain::Position& position,
                    const RuleContext& context) override;

  const std::string& name() const override { return name_; }

  bool enabled() const override {
    return trailing_.mode() == config::TrailingMode::Tiered;
  }

 private:
  TrailingEngine& trailing_;
  const std::string name_{"TieredOffsetRule"};
};

}  // namespace optrisk
