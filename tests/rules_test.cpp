// =============================================================================
// rules_test.cpp
// =============================================================================
// Unit tests for the individual exit rules.
//
// Validates:
//   - HardLimitRule: rupee SL/TP, static SL/TP, trailing stop binding,
//     inclusive comparisons, no decision before the first tick
//   - SecureProfitRule: rupee threshold, inclusive give-back, off by default
//   - UnderlyingExitRule: structure break against the position, weak trend,
//     volatility collapse, missing or stale underlying state
//   - SessionEndRule: wall-clock cutoff and per-class max hold time
//   - TieredOffsetRule / TrailingRule: never act on a position with no LTP
//
// Design: rules are pure functions of (position, context) apart from the
// trailing pair, so most tests hand-build a Position and a RuleContext.
// =============================================================================

#include "optrisk/eventbus/event_bus.hpp"
#include "optrisk/risk/position_store.hpp"
#include "optrisk/risk/trailing_engine.hpp"
#include "optrisk/risk/underlying_state_store.hpp"
#include "optrisk/rules/hard_limit_rule.hpp"
#include "optrisk/rules/secure_profit_rule.hpp"
#include "optrisk/rules/session_end_rule.hpp"
#include "optrisk/rules/tiered_offset_rule.hpp"
#include "optrisk/rules/trailing_rule.hpp"
#include "optrisk/rules/underlying_exit_rule.hpp"
#include "optrisk/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>

namespace {

constexpr std::int64_t kTenAmIst = 1'705'293'000'000;      // 2024-01-15 10:00
constexpr std::int64_t kSessionEndIst = 1'705'312'200'000;  // 2024-01-15 15:20
constexpr std::int64_t kMinuteMs = 60'000;

const optrisk::domain::InstrumentKey kNifty{"IDX_I", "13"};

// Position marked to `ltp` the same way PositionStore does it.
optrisk::domain::Position markedPosition(double ltp, double entry = 100.0,
                                         double qty = 50.0) {
  optrisk::domain::Position p;
  p.id = 1;
  p.instrument = {"NSE_FNO", "49081"};
  p.index_key = "NIFTY";
  p.entry_price = entry;
  p.quantity = qty;
  p.ltp = ltp;
  p.opened_at_ms = kTenAmIst;
  if (ltp > 0.0) {
    p.pnl = (ltp - entry) * qty;
    p.pnl_pct = optrisk::domain::roundTo((ltp - entry) / entry * 100.0, 4);
    p.peak_profit_pct = std::max(p.pnl_pct, 0.0);
  }
  return p;
}

optrisk::RuleContext contextAt(std::int64_t now_ms,
                               const optrisk::IUnderlyingStateProvider*
                                   underlying = nullptr) {
  optrisk::RuleContext ctx;
  ctx.now_ms = now_ms;
  ctx.underlying = underlying;
  return ctx;
}

class FakeUnderlying final : public optrisk::IUnderlyingStateProvider {
 public:
  std::optional<optrisk::domain::UnderlyingState> latest(
      const optrisk::domain::InstrumentKey& underlying) const override {
    auto it = states.find(underlying.composite());
    if (it == states.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::map<std::string, optrisk::domain::UnderlyingState> states;
};

}  // namespace

// =============================================================================
// HardLimitRule
// =============================================================================

class HardLimitRuleTest : public ::testing::Test {
 protected:
  optrisk::config::HardLimitConfig config;
};

// -----------------------------------------------------------------------------
// 1. Static stop loss is inclusive.
// -----------------------------------------------------------------------------
TEST_F(HardLimitRuleTest, StaticStopLossInclusive) {
  optrisk::HardLimitRule rule(config);

  auto pos = markedPosition(70.01);
  pos.thresholds.sl_pct = 30.0;
  EXPECT_FALSE(rule.evaluate(pos, contextAt(kTenAmIst)).isExit());

  pos = markedPosition(70.0);
  pos.thresholds.sl_pct = 30.0;
  auto d = rule.evaluate(pos, contextAt(kTenAmIst));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "stop_loss_hit");
  EXPECT_EQ(d.rule, "HardLimitRule");
}

// -----------------------------------------------------------------------------
// 2. A trailing offset above the static stop is the binding stop.
// -----------------------------------------------------------------------------
TEST_F(HardLimitRuleTest, TrailingOffsetBindsWhenTighter) {
  optrisk::HardLimitRule rule(config);

  auto pos = markedPosition(110.0);
  pos.thresholds.sl_pct = 30.0;
  pos.sl_offset_pct = 10.0;
  auto d = rule.evaluate(pos, contextAt(kTenAmIst));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "trailing_stop_hit");
}

// -----------------------------------------------------------------------------
// 3. A looser trailing offset never overrides the static stop.
// -----------------------------------------------------------------------------
TEST_F(HardLimitRuleTest, LooserOffsetLeavesStaticStop) {
  optrisk::HardLimitRule rule(config);

  auto pos = markedPosition(70.0);
  pos.thresholds.sl_pct = 30.0;
  pos.sl_offset_pct = -40.0;
  auto d = rule.evaluate(pos, contextAt(kTenAmIst));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "stop_loss_hit");
}

// -----------------------------------------------------------------------------
// 4. Take profit from percent and from price; the nearer one wins.
// -----------------------------------------------------------------------------
TEST_F(HardLimitRuleTest, TakeProfitNearestLevel) {
  optrisk::HardLimitRule rule(config);

  auto pos = markedPosition(140.0);
  pos.thresholds.tp_pct = 60.0;
  EXPECT_FALSE(rule.evaluate(pos, contextAt(kTenAmIst)).isExit());

  pos.thresholds.tp_price = 130.0;
  auto d = rule.evaluate(pos, contextAt(kTenAmIst));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "take_profit_hit");
}

// -----------------------------------------------------------------------------
// 5. Rupee limits: configured default and per-position override.
// -----------------------------------------------------------------------------
TEST_F(HardLimitRuleTest, RupeeLimits) {
  config.max_loss_rupees = 1000.0;
  config.target_profit_rupees = 2500.0;
  optrisk::HardLimitRule rule(config);

  auto loss = markedPosition(80.0);  // −1000
  auto d = rule.evaluate(loss, contextAt(kTenAmIst));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "hard_rupee_sl");

  loss.thresholds.max_loss_rupees = 1500.0;
  EXPECT_FALSE(rule.evaluate(loss, contextAt(kTenAmIst)).isExit());

  auto win = markedPosition(150.0);  // +2500
  d = rule.evaluate(win, contextAt(kTenAmIst));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "hard_rupee_tp");
}

// -----------------------------------------------------------------------------
// 6. Nothing is decided before the first tick.
// -----------------------------------------------------------------------------
TEST_F(HardLimitRuleTest, NoDecisionWithoutLtp) {
  config.max_loss_rupees = 1.0;
  optrisk::HardLimitRule rule(config);

  auto pos = markedPosition(0.0);
  pos.thresholds.sl_pct = 30.0;
  pos.sl_offset_pct = 10.0;
  EXPECT_FALSE(rule.evaluate(pos, contextAt(kTenAmIst)).isExit());
}

// =============================================================================
// SecureProfitRule
// =============================================================================

class SecureProfitRuleTest : public ::testing::Test {
 protected:
  void SetUp() override { config.secure_profit_enabled = true; }

  // Marked at `ltp` on 50 lots, after a peak of `peak` percent.
  static optrisk::domain::Position afterPeak(double ltp, double peak) {
    auto p = markedPosition(ltp);
    p.peak_profit_pct = peak;
    return p;
  }

  optrisk::config::HardLimitConfig config;
};

// -----------------------------------------------------------------------------
// 1. Above the rupee threshold a 7 point give-back exits.
// -----------------------------------------------------------------------------
TEST_F(SecureProfitRuleTest, ExitsOnGiveBackAboveThreshold) {
  optrisk::SecureProfitRule rule(config);

  auto d = rule.evaluate(afterPeak(123.0, 30.0), contextAt(kTenAmIst));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason,
            "secure_profit_exit (profit: 1150.00, drawdown: 7.00% from peak "
            "30.00%)");
  EXPECT_EQ(d.rule, "SecureProfitRule");
}

// -----------------------------------------------------------------------------
// 2. The drawdown boundary is inclusive.
// -----------------------------------------------------------------------------
TEST_F(SecureProfitRuleTest, DrawdownBoundaryInclusive) {
  optrisk::SecureProfitRule rule(config);

  EXPECT_TRUE(rule.evaluate(afterPeak(127.0, 30.0), contextAt(kTenAmIst))
                  .isExit());
  EXPECT_FALSE(rule.evaluate(afterPeak(127.5, 30.0), contextAt(kTenAmIst))
                   .isExit());
}

// -----------------------------------------------------------------------------
// 3. Below the rupee threshold the give-back is left to the trailing rules.
// Why: Small winners keep the wider peak-drawdown allowance.
// -----------------------------------------------------------------------------
TEST_F(SecureProfitRuleTest, BelowThresholdIsNoAction) {
  optrisk::SecureProfitRule rule(config);

  auto pos = afterPeak(119.0, 30.0);  // +950
  EXPECT_FALSE(rule.evaluate(pos, contextAt(kTenAmIst)).isExit());

  config.secure_profit_threshold_rupees = 900.0;
  optrisk::SecureProfitRule lower(config);
  EXPECT_TRUE(lower.evaluate(pos, contextAt(kTenAmIst)).isExit());
}

// -----------------------------------------------------------------------------
// 4. Off by default; a zero threshold also disables it.
// -----------------------------------------------------------------------------
TEST_F(SecureProfitRuleTest, DisabledByDefaultOrZeroThreshold) {
  EXPECT_FALSE(
      optrisk::SecureProfitRule(optrisk::config::HardLimitConfig{}).enabled());

  config.secure_profit_threshold_rupees = 0.0;
  optrisk::SecureProfitRule rule(config);
  EXPECT_TRUE(rule.enabled());
  EXPECT_FALSE(
      rule.evaluate(afterPeak(123.0, 30.0), contextAt(kTenAmIst)).isExit());
  EXPECT_FALSE(rule.evaluate(markedPosition(0.0), contextAt(kTenAmIst))
                   .isExit());
}

// =============================================================================
// UnderlyingExitRule
// =============================================================================

class UnderlyingExitRuleTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config.enabled = true;
    position = markedPosition(105.0);
    position.underlying = kNifty;
    position.direction = optrisk::domain::Direction::Bullish;
  }

  optrisk::domain::UnderlyingState& state() {
    auto& s = provider.states[kNifty.composite()];
    s.underlying = kNifty;
    return s;
  }

  optrisk::config::UnderlyingExitConfig config;
  FakeUnderlying provider;
  optrisk::domain::Position position;
};

// -----------------------------------------------------------------------------
// 1. Structure broken against the position exits; broken with it holds.
// -----------------------------------------------------------------------------
TEST_F(UnderlyingExitRuleTest, StructureBreakAgainstPosition) {
  optrisk::UnderlyingExitRule rule(config);
  state().structure_state = optrisk::domain::StructureState::Broken;

  state().structure_direction = optrisk::domain::Direction::Bullish;
  EXPECT_FALSE(rule.evaluate(position, contextAt(kTenAmIst, &provider)).isExit());

  state().structure_direction = optrisk::domain::Direction::Bearish;
  auto d = rule.evaluate(position, contextAt(kTenAmIst, &provider));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "underlying_structure_break");

  position.direction = optrisk::domain::Direction::Bearish;
  EXPECT_FALSE(rule.evaluate(position, contextAt(kTenAmIst, &provider)).isExit());
}

// -----------------------------------------------------------------------------
// 2. Trend score under the threshold exits.
// -----------------------------------------------------------------------------
TEST_F(UnderlyingExitRuleTest, WeakTrend) {
  optrisk::UnderlyingExitRule rule(config);

  state().trend_score = 10.0;
  EXPECT_FALSE(rule.evaluate(position, contextAt(kTenAmIst, &provider)).isExit());

  state().trend_score = 8.0;
  auto d = rule.evaluate(position, contextAt(kTenAmIst, &provider));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "underlying_trend_weak");
}

// -----------------------------------------------------------------------------
// 3. Falling volatility under the collapse multiplier exits.
// -----------------------------------------------------------------------------
TEST_F(UnderlyingExitRuleTest, AtrCollapse) {
  optrisk::UnderlyingExitRule rule(config);
  state().volatility_ratio = 0.5;

  state().volatility_trend = optrisk::domain::VolatilityTrend::Rising;
  EXPECT_FALSE(rule.evaluate(position, contextAt(kTenAmIst, &provider)).isExit());

  state().volatility_trend = optrisk::domain::VolatilityTrend::Falling;
  auto d = rule.evaluate(position, contextAt(kTenAmIst, &provider));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "underlying_atr_collapse");
}

// -----------------------------------------------------------------------------
// 4. No underlying link, no provider, or no state: no action.
// -----------------------------------------------------------------------------
TEST_F(UnderlyingExitRuleTest, MissingStateIsNoAction) {
  optrisk::UnderlyingExitRule rule(config);
  state().trend_score = 1.0;

  EXPECT_FALSE(rule.evaluate(position, contextAt(kTenAmIst)).isExit());

  auto unlinked = position;
  unlinked.underlying.reset();
  EXPECT_FALSE(rule.evaluate(unlinked, contextAt(kTenAmIst, &provider)).isExit());

  auto other = position;
  other.underlying = optrisk::domain::InstrumentKey{"IDX_I", "25"};
  EXPECT_FALSE(rule.evaluate(other, contextAt(kTenAmIst, &provider)).isExit());
}

// -----------------------------------------------------------------------------
// 5. The rule is off unless configured.
// -----------------------------------------------------------------------------
TEST_F(UnderlyingExitRuleTest, DisabledByDefault) {
  EXPECT_FALSE(
      optrisk::UnderlyingExitRule(optrisk::config::UnderlyingExitConfig{})
          .enabled());
  EXPECT_TRUE(optrisk::UnderlyingExitRule(config).enabled());
}

// -----------------------------------------------------------------------------
// 6. UnderlyingStateStore hides snapshots older than the staleness bound.
// Why: A frozen indicator feed must not keep firing (or blocking) exits.
// -----------------------------------------------------------------------------
TEST_F(UnderlyingExitRuleTest, StaleStateIsIgnored) {
  optrisk::EventBus bus;
  optrisk::SimulationTimeProvider clock{kTenAmIst};
  optrisk::UnderlyingStateStore store(bus, clock, 5000);

  optrisk::UnderlyingStateEvent e;
  e.state.underlying = kNifty;
  e.state.trend_score = 2.0;
  bus.publish(e);

  optrisk::UnderlyingExitRule rule(config);
  EXPECT_TRUE(rule.evaluate(position, contextAt(kTenAmIst, &store)).isExit());

  clock.advance_by(5001);
  EXPECT_FALSE(store.latest(kNifty).has_value());
  EXPECT_FALSE(rule.evaluate(position, contextAt(clock.now_ms(), &store)).isExit());
}

// =============================================================================
// SessionEndRule
// =============================================================================

class SessionEndRuleTest : public ::testing::Test {
 protected:
  optrisk::config::SessionConfig session;
  optrisk::config::TimeStopConfig time_stop;
};

// -----------------------------------------------------------------------------
// 1. 15:19 IST holds, 15:20 IST exits.
// -----------------------------------------------------------------------------
TEST_F(SessionEndRuleTest, ExitsAtConfiguredTime) {
  optrisk::SessionEndRule rule(session, time_stop);
  EXPECT_EQ(rule.exitMinuteOfDay(), 15 * 60 + 20);

  auto pos = markedPosition(0.0);  // no tick needed for the session cutoff
  EXPECT_FALSE(rule.evaluate(pos, contextAt(kSessionEndIst - kMinuteMs)).isExit());

  auto d = rule.evaluate(pos, contextAt(kSessionEndIst));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "session_end_exit");
  EXPECT_EQ(d.rule, "SessionEndRule");
}

// -----------------------------------------------------------------------------
// 2. Time stop by instrument class, default for unknown classes.
// -----------------------------------------------------------------------------
TEST_F(SessionEndRuleTest, TimeStopPerInstrumentClass) {
  time_stop.enabled = true;
  optrisk::SessionEndRule rule(session, time_stop);

  auto nifty = markedPosition(101.0);
  EXPECT_FALSE(
      rule.evaluate(nifty, contextAt(kTenAmIst + 44 * kMinuteMs)).isExit());
  auto d = rule.evaluate(nifty, contextAt(kTenAmIst + 45 * kMinuteMs));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.reason, "time_stop");

  auto sensex = nifty;
  sensex.index_key = "SENSEX";
  EXPECT_FALSE(
      rule.evaluate(sensex, contextAt(kTenAmIst + 60 * kMinuteMs)).isExit());
  EXPECT_TRUE(
      rule.evaluate(sensex, contextAt(kTenAmIst + 90 * kMinuteMs)).isExit());

  auto other = nifty;
  other.index_key = "FINNIFTY";
  EXPECT_TRUE(
      rule.evaluate(other, contextAt(kTenAmIst + 45 * kMinuteMs)).isExit());
}

// -----------------------------------------------------------------------------
// 3. Time stop is off unless configured.
// -----------------------------------------------------------------------------
TEST_F(SessionEndRuleTest, TimeStopDisabledByDefault) {
  optrisk::SessionEndRule rule(session, time_stop);
  auto pos = markedPosition(101.0);
  EXPECT_FALSE(
      rule.evaluate(pos, contextAt(kTenAmIst + 200 * kMinuteMs)).isExit());
}

// =============================================================================
// TieredOffsetRule / TrailingRule
// =============================================================================

class TrailingRulesTest : public ::testing::Test {
 protected:
  optrisk::EventBus bus;
  optrisk::SimulationTimeProvider clock{kTenAmIst};
  optrisk::PositionStore store{bus, clock};
  optrisk::TrailingEngine engine{
      store, optrisk::config::TrailingConfig{},
      optrisk::config::ReverseLossConfig{},
      optrisk::DrawdownSchedule(optrisk::config::DrawdownConfig{},
                                optrisk::config::ReverseLossConfig{})};

  void SetUp() override {
    auto p = markedPosition(0.0);
    store.add(p);
  }
};

// -----------------------------------------------------------------------------
// 1. The tier rule only writes offsets and never exits.
// -----------------------------------------------------------------------------
TEST_F(TrailingRulesTest, TieredOffsetRuleWritesButNeverExits) {
  optrisk::TieredOffsetRule rule(engine);

  // Snapshot-style position whose profit says 30% but has no LTP yet.
  auto no_ltp = markedPosition(0.0);
  no_ltp.pnl_pct = 30.0;
  EXPECT_FALSE(rule.evaluate(no_ltp, contextAt(kTenAmIst)).isExit());
  EXPECT_FALSE(store.snapshot(1)->sl_offset_pct.has_value());

  auto marked = markedPosition(130.0);
  EXPECT_FALSE(rule.evaluate(marked, contextAt(kTenAmIst)).isExit());
  EXPECT_DOUBLE_EQ(*store.snapshot(1)->sl_offset_pct, 10.0);
}

// -----------------------------------------------------------------------------
// 2. The trailing rule holds without an LTP even if the numbers say exit.
// -----------------------------------------------------------------------------
TEST_F(TrailingRulesTest, TrailingRuleNeedsLtp) {
  optrisk::TrailingRule rule(engine);

  auto pos = markedPosition(0.0);
  pos.peak_profit_pct = 30.0;
  pos.pnl_pct = 20.0;
  EXPECT_FALSE(rule.evaluate(pos, contextAt(kTenAmIst)).isExit());

  pos.ltp = 120.0;
  auto d = rule.evaluate(pos, contextAt(kTenAmIst));
  ASSERT_TRUE(d.isExit());
  EXPECT_EQ(d.rule, "TrailingRule");
}
