// =============================================================================
// market_data_gateway_test.cpp
// =============================================================================
// Unit tests for optrisk::MarketDataGateway::parseMessage.
//
// Validates:
//   - Tick messages decode to TickEvent (numeric or string security_id)
//   - "underlying_state" messages decode to UnderlyingStateEvent
//   - Missing fields, wrong types and non-JSON payloads are rejected
//
// Design: parseMessage is static and socket-free, so no ZMQ traffic is
// needed. The receive loop is exercised by the engine smoke run.
// =============================================================================

#include "optrisk/gateway/market_data_gateway.hpp"

#include <gtest/gtest.h>

#include <variant>

using optrisk::MarketDataGateway;

// -----------------------------------------------------------------------------
// 1. A full tick.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayParseTest, DecodesTick) {
  auto event = MarketDataGateway::parseMessage(
      R"({"segment":"NSE_FNO","security_id":"49081","last_price":132.4,)"
      R"("timestamp":1705293000000})");
  ASSERT_TRUE(event.has_value());

  const auto* tick = std::get_if<optrisk::TickEvent>(&*event);
  ASSERT_NE(tick, nullptr);
  EXPECT_EQ(tick->instrument.segment, "NSE_FNO");
  EXPECT_EQ(tick->instrument.security_id, "49081");
  EXPECT_DOUBLE_EQ(tick->last_price, 132.4);
  EXPECT_EQ(tick->timestamp_ms, 1705293000000);
}

// -----------------------------------------------------------------------------
// 2. Numeric security ids are normalised to strings; timestamp is optional.
// Why: Broker feeds send security_id as either type. Both must land on the
//      same index key as the position.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayParseTest, NumericSecurityIdAndNoTimestamp) {
  auto event = MarketDataGateway::parseMessage(
      R"({"segment":"NSE_FNO","security_id":49081,"last_price":99})");
  ASSERT_TRUE(event.has_value());

  const auto& tick = std::get<optrisk::TickEvent>(*event);
  EXPECT_EQ(tick.instrument.security_id, "49081");
  EXPECT_EQ(tick.timestamp_ms, 0);
}

// -----------------------------------------------------------------------------
// 3. Underlying state snapshot.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayParseTest, DecodesUnderlyingState) {
  auto event = MarketDataGateway::parseMessage(
      R"({"type":"underlying_state","segment":"IDX_I","security_id":"13",)"
      R"("trend_score":8.5,"structure_state":"broken",)"
      R"("structure_direction":"bearish","volatility_trend":"falling",)"
      R"("volatility_ratio":0.6,"timestamp":1705293001000})");
  ASSERT_TRUE(event.has_value());

  const auto* e = std::get_if<optrisk::UnderlyingStateEvent>(&*event);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->state.underlying.composite(), "IDX_I:13");
  EXPECT_DOUBLE_EQ(*e->state.trend_score, 8.5);
  EXPECT_EQ(e->state.structure_state, optrisk::domain::StructureState::Broken);
  EXPECT_EQ(e->state.structure_direction, optrisk::domain::Direction::Bearish);
  EXPECT_EQ(e->state.volatility_trend,
            optrisk::domain::VolatilityTrend::Falling);
  EXPECT_DOUBLE_EQ(*e->state.volatility_ratio, 0.6);
  EXPECT_EQ(e->state.observed_at_ms, 1705293001000);
}

// -----------------------------------------------------------------------------
// 4. Sparse underlying state: unknown enums, absent numbers.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayParseTest, SparseUnderlyingState) {
  auto event = MarketDataGateway::parseMessage(
      R"({"type":"underlying_state","segment":"IDX_I","security_id":"25",)"
      R"("structure_state":"sideways"})");
  ASSERT_TRUE(event.has_value());

  const auto& s = std::get<optrisk::UnderlyingStateEvent>(*event).state;
  EXPECT_FALSE(s.trend_score.has_value());
  EXPECT_FALSE(s.volatility_ratio.has_value());
  EXPECT_EQ(s.structure_state, optrisk::domain::StructureState::Unknown);
  EXPECT_EQ(s.structure_direction, optrisk::domain::Direction::Neutral);
}

// -----------------------------------------------------------------------------
// 5. Rejections.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayParseTest, RejectsMalformedMessages) {
  EXPECT_FALSE(MarketDataGateway::parseMessage("not json").has_value());
  EXPECT_FALSE(MarketDataGateway::parseMessage("[1,2,3]").has_value());
  EXPECT_FALSE(MarketDataGateway::parseMessage(
                   R"({"segment":"NSE_FNO","last_price":10})")
                   .has_value());
  EXPECT_FALSE(MarketDataGateway::parseMessage(
                   R"({"segment":"NSE_FNO","security_id":"1"})")
                   .has_value());
  EXPECT_FALSE(MarketDataGateway::parseMessage(
                   R"({"segment":"NSE_FNO","security_id":"1",)"
                   R"("last_price":"ten"})")
                   .has_value());
}
