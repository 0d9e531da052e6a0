// =============================================================================
// pricing_test.cpp
// =============================================================================
// Unit tests for optrisk::BlackScholes and optrisk::GreeksEngine.
//
// Validates:
//   - Closed-form values and Greeks against reference numbers
//   - Put-call parity
//   - Expired and zero-volatility branches
//   - Exposure scaling and position sign/size
//   - Additivity of aggregated Greeks
// =============================================================================

#include "optrisk/pricing/black_scholes.hpp"
#include "optrisk/pricing/greeks_engine.hpp"
#include "optrisk/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>

using optrisk::BlackScholes;
using optrisk::GreeksEngine;
using optrisk::PricingInputs;
using optrisk::domain::OptionLeg;
using optrisk::domain::OptionType;
using optrisk::domain::Side;

static PricingInputs atm(OptionType type, double tau = 1.0,
                         double sigma = 0.2) {
  PricingInputs in;
  in.type = type;
  in.spot = 100.0;
  in.strike = 100.0;
  in.tau = tau;
  in.rate = 0.05;
  in.dividend_yield = 0.0;
  in.volatility = sigma;
  return in;
}

// 2025-01-01T00:00:00Z
static constexpr std::int64_t kValuationMs = 1735689600000;

// -----------------------------------------------------------------------------
// 1. Textbook ATM values (S=K=100, r=5%, σ=20%, τ=1).
// -----------------------------------------------------------------------------
TEST(BlackScholesTest, ReferenceValues) {
  auto call = BlackScholes::value(atm(OptionType::Call));
  auto put = BlackScholes::value(atm(OptionType::Put));

  EXPECT_NEAR(call.value, 10.4506, 1e-3);
  EXPECT_NEAR(put.value, 5.5735, 1e-3);
  EXPECT_NEAR(call.delta, 0.6368, 1e-3);
  EXPECT_NEAR(put.delta, -0.3632, 1e-3);
  EXPECT_NEAR(call.gamma, 0.018762, 1e-5);
  EXPECT_NEAR(call.vega, 37.524, 1e-2);
  EXPECT_DOUBLE_EQ(call.gamma, put.gamma);
  EXPECT_LT(call.theta, 0.0);
  EXPECT_GT(call.rho, 0.0);
  EXPECT_LT(put.rho, 0.0);
}

// -----------------------------------------------------------------------------
// 2. Put-call parity: C - P = S e^{-qτ} - K e^{-rτ}.
// -----------------------------------------------------------------------------
TEST(BlackScholesTest, PutCallParity) {
  auto in = atm(OptionType::Call, 0.5, 0.35);
  in.strike = 110.0;
  in.dividend_yield = 0.02;
  auto call = BlackScholes::value(in);
  in.type = OptionType::Put;
  auto put = BlackScholes::value(in);

  const double parity = 100.0 * std::exp(-0.02 * 0.5) - 110.0 * std::exp(-0.05 * 0.5);
  EXPECT_NEAR(call.value - put.value, parity, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Expired deep ITM call: value 10, delta 1, no other Greeks.
// -----------------------------------------------------------------------------
TEST(BlackScholesTest, ExpiredCallIsIntrinsic) {
  auto in = atm(OptionType::Call, 0.0);
  in.spot = 110.0;
  auto v = BlackScholes::value(in);
  EXPECT_DOUBLE_EQ(v.value, 10.0);
  EXPECT_DOUBLE_EQ(v.delta, 1.0);
  EXPECT_DOUBLE_EQ(v.gamma, 0.0);
  EXPECT_DOUBLE_EQ(v.vega, 0.0);
  EXPECT_DOUBLE_EQ(v.theta, 0.0);
}

TEST(BlackScholesTest, ExpiredPutBranches) {
  auto in = atm(OptionType::Put, -0.1);
  in.spot = 90.0;
  auto itm = BlackScholes::value(in);
  EXPECT_DOUBLE_EQ(itm.value, 10.0);
  EXPECT_DOUBLE_EQ(itm.delta, -1.0);

  in.spot = 100.0;
  auto atm_put = BlackScholes::value(in);
  EXPECT_DOUBLE_EQ(atm_put.value, 0.0);
  EXPECT_DOUBLE_EQ(atm_put.delta, 0.0);
}

// -----------------------------------------------------------------------------
// 4. Zero volatility: discounted forward intrinsic, no curvature.
// -----------------------------------------------------------------------------
TEST(BlackScholesTest, ZeroVolatilityIsForwardIntrinsic) {
  auto v = BlackScholes::value(atm(OptionType::Call, 1.0, 0.0));
  EXPECT_NEAR(v.value, 100.0 - 100.0 * std::exp(-0.05), 1e-12);
  EXPECT_DOUBLE_EQ(v.delta, 1.0);
  EXPECT_DOUBLE_EQ(v.gamma, 0.0);

  auto p = BlackScholes::value(atm(OptionType::Put, 1.0, 0.0));
  EXPECT_DOUBLE_EQ(p.value, 0.0);
  EXPECT_DOUBLE_EQ(p.delta, 0.0);
}

// -----------------------------------------------------------------------------
// 5. Exposure units divide vega and rho by 100 and theta by 365.
// -----------------------------------------------------------------------------
TEST(BlackScholesTest, ExposureScaling) {
  auto raw = BlackScholes::value(atm(OptionType::Call));
  auto exp = BlackScholes::toExposure(raw);
  EXPECT_DOUBLE_EQ(exp.vega, raw.vega / 100.0);
  EXPECT_DOUBLE_EQ(exp.theta, raw.theta / 365.0);
  EXPECT_DOUBLE_EQ(exp.rho, raw.rho / 100.0);
  EXPECT_DOUBLE_EQ(exp.delta, raw.delta);
}

// -----------------------------------------------------------------------------
// 6. Leg Greeks scale with direction, contracts and the 100 multiplier.
// -----------------------------------------------------------------------------
TEST(GreeksEngineTest, LegGreeksScaleBySideAndSize) {
  GreeksEngine engine;
  auto long_call = OptionLeg::create("SPY", OptionType::Call, Side::Buy, 100.0,
                                     "2026-01-01", 2, 10.0, 0.2, 100.0);
  auto short_call = OptionLeg::create("SPY", OptionType::Call, Side::Sell,
                                      100.0, "2026-01-01", 2, 10.0, 0.2, 100.0);

  auto per_share = BlackScholes::toExposure(engine.valueLeg(long_call, kValuationMs));
  auto g_long = engine.legGreeks(long_call, kValuationMs);
  auto g_short = engine.legGreeks(short_call, kValuationMs);

  EXPECT_DOUBLE_EQ(g_long.delta, per_share.delta * 200.0);
  EXPECT_DOUBLE_EQ(g_short.delta, -g_long.delta);
  EXPECT_DOUBLE_EQ(g_short.vega, -g_long.vega);
  EXPECT_GT(g_long.gamma, 0.0);
  EXPECT_LT(g_long.theta, 0.0);
}

// -----------------------------------------------------------------------------
// 7. aggregate() is exactly the sum of the per-leg contributions.
// -----------------------------------------------------------------------------
TEST(GreeksEngineTest, AggregateIsAdditive) {
  GreeksEngine engine;
  auto call = OptionLeg::create("SPY", OptionType::Call, Side::Buy, 95.0,
                                "2025-03-21", 3, 7.0, 0.25, 100.0);
  auto put = OptionLeg::create("SPY", OptionType::Put, Side::Buy, 105.0,
                               "2025-03-21", 1, 7.0, 0.25, 100.0);

  auto a = engine.legGreeks(call, kValuationMs);
  auto b = engine.legGreeks(put, kValuationMs);
  auto total = engine.aggregate({call, put}, kValuationMs);

  EXPECT_DOUBLE_EQ(total.delta, a.delta + b.delta);
  EXPECT_DOUBLE_EQ(total.gamma, a.gamma + b.gamma);
  EXPECT_DOUBLE_EQ(total.theta, a.theta + b.theta);
  EXPECT_DOUBLE_EQ(total.vega, a.vega + b.vega);
  EXPECT_DOUBLE_EQ(total.rho, a.rho + b.rho);
  EXPECT_GT(a.delta, 0.0);
  EXPECT_LT(b.delta, 0.0);
}

// -----------------------------------------------------------------------------
// 8. A leg valued on its expiry day prices at intrinsic.
// -----------------------------------------------------------------------------
TEST(GreeksEngineTest, ExpiryDayUsesIntrinsic) {
  GreeksEngine engine;
  auto leg = OptionLeg::create("SPY", OptionType::Call, Side::Buy, 100.0,
                               "2025-01-01", 1, 1.0, 0.3, 110.0);
  auto v = engine.valueLeg(leg, kValuationMs);
  EXPECT_DOUBLE_EQ(v.value, 10.0);
  EXPECT_DOUBLE_EQ(v.delta, 1.0);
  EXPECT_DOUBLE_EQ(engine.legGreeks(leg, kValuationMs).delta, 100.0);
}
