// =============================================================================
// probability_test.cpp
// =============================================================================
// Unit tests for optrisk::PayoffProfile and optrisk::ProbabilityAnalyzer.
//
// Validates:
//   - Lognormal CDF median and degenerate laws
//   - Closed-form and scanned breakevens
//   - PoP monotonic in the breakeven, bounded in [0, 100]
//   - Early-exit probabilities ordered, bounded and distance-sensitive
//   - Horizon P&L for mixed expiries
// =============================================================================

#include "optrisk/domain/errors.hpp"
#include "optrisk/probability/payoff_profile.hpp"
#include "optrisk/probability/probability_analyzer.hpp"
#include "optrisk/strategy/strategy_classifier.hpp"
#include "optrisk/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>

using optrisk::GreeksEngine;
using optrisk::PayoffProfile;
using optrisk::ProbabilityAnalyzer;
using optrisk::domain::OptionLeg;
using optrisk::domain::OptionType;
using optrisk::domain::Side;

namespace {

// 2025-01-01T00:00:00Z
constexpr std::int64_t kValuationMs = 1735689600000;
constexpr const char* kExpiry = "2025-03-01";

OptionLeg leg(OptionType type, Side side, double strike, double premium,
              const char* expiry = kExpiry, double qty = 1.0) {
  return OptionLeg::create("SPY", type, side, strike, expiry, qty, premium,
                           0.25, 100.0);
}

double tauToExpiry() { return 59.0 / 365.0; }

}  // namespace

// -----------------------------------------------------------------------------
// 1. The median of the lognormal law sits at S0 e^{(r-q-σ²/2)τ}.
// -----------------------------------------------------------------------------
TEST(LognormalTest, MedianAndDegenerateCases) {
  const double median = 100.0 * std::exp((0.05 - 0.5 * 0.04) * 0.5);
  EXPECT_NEAR(optrisk::lognormalCdf(median, 100.0, 0.2, 0.5, 0.05, 0.0), 0.5,
              1e-12);
  EXPECT_DOUBLE_EQ(optrisk::lognormalCdf(0.0, 100.0, 0.2, 0.5, 0.05, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(optrisk::lognormalCdf(99.0, 100.0, 0.2, 0.0, 0.05, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(optrisk::lognormalCdf(100.0, 100.0, 0.2, 0.0, 0.05, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(optrisk::lognormalCdf(104.0, 100.0, 0.0, 1.0, 0.05, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(optrisk::lognormalCdf(106.0, 100.0, 0.0, 1.0, 0.05, 0.0), 1.0);
}

// -----------------------------------------------------------------------------
// 2. Single-leg breakevens use K ± premium / 100.
// -----------------------------------------------------------------------------
TEST(ProbabilityAnalyzerTest, SingleLegBreakevens) {
  ProbabilityAnalyzer analyzer;
  PayoffProfile call({leg(OptionType::Call, Side::Buy, 100.0, 500.0)}, GreeksEngine());
  PayoffProfile put({leg(OptionType::Put, Side::Sell, 95.0, 250.0)}, GreeksEngine());

  auto be_call = analyzer.findBreakevens(call, 100.0);
  auto be_put = analyzer.findBreakevens(put, 100.0);
  ASSERT_EQ(be_call.size(), 1u);
  ASSERT_EQ(be_put.size(), 1u);
  EXPECT_DOUBLE_EQ(be_call[0], 105.0);
  EXPECT_DOUBLE_EQ(be_put[0], 92.5);
}

// -----------------------------------------------------------------------------
// 3. A long call's PoP falls strictly as its breakeven rises.
// -----------------------------------------------------------------------------
TEST(ProbabilityAnalyzerTest, PopDecreasesAsBreakevenRises) {
  ProbabilityAnalyzer analyzer;
  double previous = 101.0;
  for (double premium : {100.0, 300.0, 500.0, 800.0, 1200.0}) {
    PayoffProfile profile({leg(OptionType::Call, Side::Buy, 100.0, premium)},
                          GreeksEngine());
    auto be = analyzer.findBreakevens(profile, 100.0);
    const double pop =
        analyzer.probabilityOfProfit(profile, be, 100.0, 0.25, tauToExpiry());
    EXPECT_LT(pop, previous) << "premium " << premium;
    EXPECT_GE(pop, 0.0);
    EXPECT_LE(pop, 100.0);
    previous = pop;
  }
}

// -----------------------------------------------------------------------------
// 4. Iron condor: two scanned breakevens at the short strikes ± credit, and
//    PoP equals the lognormal mass between them.
// -----------------------------------------------------------------------------
TEST(ProbabilityAnalyzerTest, IronCondorBreakevensAndPop) {
  ProbabilityAnalyzer analyzer;
  PayoffProfile profile({leg(OptionType::Call, Side::Sell, 110.0, 300.0),
                         leg(OptionType::Call, Side::Buy, 120.0, 100.0),
                         leg(OptionType::Put, Side::Sell, 90.0, 300.0),
                         leg(OptionType::Put, Side::Buy, 80.0, 100.0)},
                        GreeksEngine());

  auto be = analyzer.findBreakevens(profile, 100.0);
  ASSERT_EQ(be.size(), 2u);
  EXPECT_NEAR(be[0], 86.0, 1e-6);
  EXPECT_NEAR(be[1], 114.0, 1e-6);

  const double tau = tauToExpiry();
  const double expected =
      100.0 * (optrisk::lognormalCdf(114.0, 100.0, 0.25, tau, 0.05, 0.0) -
               optrisk::lognormalCdf(86.0, 100.0, 0.25, tau, 0.05, 0.0));
  EXPECT_NEAR(analyzer.probabilityOfProfit(profile, be, 100.0, 0.25, tau),
              expected, 1e-4);
}

// -----------------------------------------------------------------------------
// 5. Long straddle profits outside its breakevens.
// -----------------------------------------------------------------------------
TEST(ProbabilityAnalyzerTest, LongStraddleProfitsInTails) {
  ProbabilityAnalyzer analyzer;
  PayoffProfile profile({leg(OptionType::Call, Side::Buy, 100.0, 400.0),
                         leg(OptionType::Put, Side::Buy, 100.0, 400.0)},
                        GreeksEngine());
  auto be = analyzer.findBreakevens(profile, 100.0);
  ASSERT_EQ(be.size(), 2u);
  EXPECT_NEAR(be[0], 92.0, 1e-6);
  EXPECT_NEAR(be[1], 108.0, 1e-6);

  const double tau = tauToExpiry();
  const double inside =
      100.0 * (optrisk::lognormalCdf(108.0, 100.0, 0.25, tau, 0.05, 0.0) -
               optrisk::lognormalCdf(92.0, 100.0, 0.25, tau, 0.05, 0.0));
  EXPECT_NEAR(analyzer.probabilityOfProfit(profile, be, 100.0, 0.25, tau),
              100.0 - inside, 1e-4);
}

// -----------------------------------------------------------------------------
// 6. Marked P&L sits between entry and expiry: a long call marked before
//    expiry keeps time value, and at or after expiry it is intrinsic only.
// -----------------------------------------------------------------------------
TEST(PayoffProfileTest, MarkedPnlUsesRemainingTime) {
  PayoffProfile profile({leg(OptionType::Call, Side::Buy, 100.0, 500.0)},
                        GreeksEngine());
  const std::int64_t expiry = optrisk::parse_iso_date(kExpiry);
  EXPECT_GT(profile.markedPnlAt(100.0, expiry - 30), profile.pnlAt(100.0));
  EXPECT_DOUBLE_EQ(profile.markedPnlAt(110.0, expiry), profile.pnlAt(110.0));
  EXPECT_DOUBLE_EQ(profile.markedPnlAt(110.0, expiry + 5), 500.0);
}

// -----------------------------------------------------------------------------
// 7. analyze(): the 25% target is never harder to reach than the 50% one.
// -----------------------------------------------------------------------------
TEST(ProbabilityAnalyzerTest, AnalyzeLongCall) {
  ProbabilityAnalyzer analyzer;
  optrisk::StrategyClassifier classifier;
  std::vector<OptionLeg> legs{leg(OptionType::Call, Side::Buy, 100.0, 450.0)};
  auto summary =
      analyzer.analyze(legs, classifier.classify(legs), kValuationMs);

  EXPECT_DOUBLE_EQ(summary.current_price, 100.0);
  ASSERT_EQ(summary.breakevens.size(), 1u);
  EXPECT_DOUBLE_EQ(summary.breakevens[0], 104.5);
  EXPECT_GT(summary.pop_expiration, 0.0);
  EXPECT_LT(summary.pop_expiration, 50.0);
  EXPECT_GT(summary.profit_50_probability, 0.0);
  EXPECT_LE(summary.profit_50_probability, summary.profit_25_probability);
  EXPECT_LE(summary.profit_25_probability, 100.0);
}

// -----------------------------------------------------------------------------
// 8. Iron condor: early-exit odds fall as spot drifts from the centre of the
//    profit zone toward a breakeven, and are never a certainty while time
//    remains.
// -----------------------------------------------------------------------------
TEST(ProbabilityAnalyzerTest, EarlyExitFallsTowardBreakeven) {
  ProbabilityAnalyzer analyzer;
  optrisk::StrategyClassifier classifier;

  auto condorAt = [](double spot) {
    auto make = [spot](OptionType type, Side side, double strike,
                       double premium) {
      return OptionLeg::create("SPY", type, side, strike, kExpiry, 1.0,
                               premium, 0.25, spot);
    };
    return std::vector<OptionLeg>{
        make(OptionType::Call, Side::Sell, 110.0, 150.0),
        make(OptionType::Call, Side::Buy, 120.0, 50.0),
        make(OptionType::Put, Side::Sell, 90.0, 150.0),
        make(OptionType::Put, Side::Buy, 80.0, 50.0)};
  };

  double previous_25 = 101.0;
  double previous_50 = 101.0;
  for (double spot : {100.0, 106.0, 109.0}) {
    const auto legs = condorAt(spot);
    const auto summary =
        analyzer.analyze(legs, classifier.classify(legs), kValuationMs);

    EXPECT_LT(summary.profit_25_probability, previous_25) << "spot " << spot;
    EXPECT_LE(summary.profit_50_probability, previous_50) << "spot " << spot;
    EXPECT_LE(summary.profit_50_probability, summary.profit_25_probability);
    EXPECT_LT(summary.profit_25_probability, 100.0);
    EXPECT_GE(summary.profit_50_probability, 0.0);

    previous_25 = summary.profit_25_probability;
    previous_50 = summary.profit_50_probability;
  }
}

// -----------------------------------------------------------------------------
// 9. A far OTM short put is likely, but not certain, to bank half its credit
//    by the interim check.
// -----------------------------------------------------------------------------
TEST(ProbabilityAnalyzerTest, FarOtmShortPutIsNotCertain) {
  ProbabilityAnalyzer analyzer;
  optrisk::StrategyClassifier classifier;
  std::vector<OptionLeg> legs{leg(OptionType::Put, Side::Sell, 80.0, 200.0)};
  auto summary =
      analyzer.analyze(legs, classifier.classify(legs), kValuationMs);
  EXPECT_GT(summary.profit_50_probability, 50.0);
  EXPECT_LT(summary.profit_50_probability, 100.0);
  EXPECT_LE(summary.profit_50_probability, summary.profit_25_probability);
  EXPECT_GT(summary.pop_expiration, 90.0);
}

// -----------------------------------------------------------------------------
// 10. Calendar: the later leg keeps time value at the horizon, so the P&L
//    peaks near the shared strike.
// -----------------------------------------------------------------------------
TEST(PayoffProfileTest, CalendarValuesLaterLegWithBlackScholes) {
  PayoffProfile profile({leg(OptionType::Call, Side::Sell, 100.0, 300.0),
                         leg(OptionType::Call, Side::Buy, 100.0, 500.0,
                             "2025-06-01")},
                        GreeksEngine());
  EXPECT_EQ(profile.horizonDay(), optrisk::parse_iso_date(kExpiry));
  EXPECT_GT(profile.pnlAt(100.0), profile.pnlAt(70.0));
  EXPECT_GT(profile.pnlAt(100.0), profile.pnlAt(140.0));
  EXPECT_GT(profile.pnlAt(100.0), 0.0);
}

TEST(PayoffProfileTest, SampleCoversRange) {
  PayoffProfile profile({leg(OptionType::Call, Side::Buy, 100.0, 500.0)},
                        GreeksEngine());
  auto curve = profile.sample(50.0, 150.0, 101);
  ASSERT_EQ(curve.size(), 101u);
  EXPECT_DOUBLE_EQ(curve.front().price, 50.0);
  EXPECT_DOUBLE_EQ(curve.front().pnl, -500.0);
  EXPECT_DOUBLE_EQ(curve.back().price, 150.0);
  EXPECT_DOUBLE_EQ(curve.back().pnl, 4500.0);
  EXPECT_DOUBLE_EQ(profile.premiumPerShare(), 5.0);
}

TEST(PayoffProfileTest, EmptyLegsRejected) {
  EXPECT_THROW(PayoffProfile({}, GreeksEngine()), optrisk::InputError);
}
