// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the optrisk::codec JSON wire format.
//
// Validates:
//   - Leg and request decoding, including optional fields and defaults
//   - Missing fields raise InputError, wrong types raise json::type_error
//   - Result encoding: rounding, "unlimited", omitted optional values
//   - Ledger and payoff curve encoding
// =============================================================================

#include "optrisk/codec/json_codec.hpp"
#include "optrisk/domain/errors.hpp"
#include "optrisk/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <limits>

using nlohmann::json;
using optrisk::InputError;
using optrisk::domain::OptionType;
using optrisk::domain::RiskLevel;
using optrisk::domain::RiskProfile;
using optrisk::domain::Side;
using optrisk::domain::StrategyType;

namespace codec = optrisk::codec;

static json legJson() {
  return json{{"symbol", "SPY"},     {"option_type", "call"},
              {"action", "SELL"},    {"strike", 110.0},
              {"expiry", "2025-03-21"}, {"quantity", 2},
              {"premium", 250.0},    {"volatility", 0.22},
              {"current_price", 100.0}};
}

// -----------------------------------------------------------------------------
// 1. A leg decodes with case-insensitive enums and a parsed expiry day.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecodesLeg) {
  auto leg = codec::legFromJson(legJson());
  EXPECT_EQ(leg.symbol, "SPY");
  EXPECT_EQ(leg.type, OptionType::Call);
  EXPECT_EQ(leg.action, Side::Sell);
  EXPECT_DOUBLE_EQ(leg.strike, 110.0);
  EXPECT_DOUBLE_EQ(leg.quantity, 2.0);
  EXPECT_EQ(leg.expiry_day, optrisk::parse_iso_date("2025-03-21"));
}

// -----------------------------------------------------------------------------
// 2. A missing leg field names the field.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, MissingLegFieldIsInputError) {
  auto j = legJson();
  j.erase("strike");
  try {
    codec::legFromJson(j);
    FAIL() << "expected InputError";
  } catch (const InputError& e) {
    EXPECT_NE(std::string(e.what()).find("strike"), std::string::npos);
  }
}

// -----------------------------------------------------------------------------
// 3. Domain validation still applies after decoding.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, InvalidLegValuesAreRejected) {
  auto j = legJson();
  j["quantity"] = 0;
  EXPECT_THROW(codec::legFromJson(j), InputError);

  j = legJson();
  j["action"] = "HOLD";
  EXPECT_THROW(codec::legFromJson(j), InputError);

  j = legJson();
  j["expiry"] = "21/03/2025";
  EXPECT_THROW(codec::legFromJson(j), InputError);
}

// -----------------------------------------------------------------------------
// 4. Wrong JSON types surface as nlohmann type errors.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, WrongTypeIsJsonTypeError) {
  auto j = legJson();
  j["strike"] = "one hundred";
  EXPECT_THROW(codec::legFromJson(j), json::type_error);
}

// -----------------------------------------------------------------------------
// 5. Request: optional fields keep defaults when absent.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, RequestDefaults) {
  json j{{"new_legs", json::array({legJson()})}, {"portfolio_cash", 10000}};
  auto req = codec::requestFromJson(j);
  EXPECT_EQ(req.new_legs.size(), 1u);
  EXPECT_TRUE(req.existing_legs.empty());
  EXPECT_DOUBLE_EQ(req.portfolio_cash, 10000.0);
  EXPECT_EQ(req.risk_profile, RiskProfile::Moderate);
  EXPECT_FALSE(req.iv_rank.has_value());
  EXPECT_TRUE(req.iv_history.empty());
  EXPECT_FALSE(req.valuation_ms.has_value());
}

// -----------------------------------------------------------------------------
// 6. Request: every optional field decoded, valuation_date → midnight UTC.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, RequestOptionalFields) {
  json j{{"new_legs", json::array({legJson()})},
         {"existing_legs", json::array({legJson(), legJson()})},
         {"portfolio_cash", 5000.5},
         {"risk_profile", "aggressive"},
         {"iv_rank", 42.0},
         {"iv_history", {0.15, 0.2, 0.3}},
         {"valuation_date", "2025-01-01"}};
  auto req = codec::requestFromJson(j);
  EXPECT_EQ(req.existing_legs.size(), 2u);
  EXPECT_EQ(req.risk_profile, RiskProfile::Aggressive);
  ASSERT_TRUE(req.iv_rank.has_value());
  EXPECT_DOUBLE_EQ(*req.iv_rank, 42.0);
  EXPECT_EQ(req.iv_history.size(), 3u);
  ASSERT_TRUE(req.valuation_ms.has_value());
  EXPECT_EQ(*req.valuation_ms, 1735689600000);
}

// -----------------------------------------------------------------------------
// 7. Missing new_legs or cash is an input error.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, RequestRequiresLegsAndCash) {
  EXPECT_THROW(codec::requestFromJson(json{{"portfolio_cash", 1.0}}),
               InputError);
  EXPECT_THROW(
      codec::requestFromJson(json{{"new_legs", json::array({legJson()})}}),
      InputError);
  EXPECT_THROW(codec::requestFromJson(json::array()), InputError);
}

// -----------------------------------------------------------------------------
// 8. Result encoding: rounding, unlimited, optional values omitted.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, EncodesResult) {
  optrisk::domain::ValidationResult r;
  r.passed = false;
  r.checks.push_back({"delta_limit", RiskLevel::Blocker, "too much delta",
                      250.456, 200.0});
  r.checks.push_back({"debit_credit", RiskLevel::Info, "credit", {}, {}});
  r.classification.type = StrategyType::ShortCall;
  r.classification.leg_count = 1;
  r.classification.net_cost = -400.004;
  r.classification.max_loss = optrisk::domain::kUnbounded;
  r.classification.max_profit = 400.0;
  r.greeks.combined.gamma = 0.123456;
  r.greeks.combined.delta = -12.3456;
  r.probability.pop_expiration = 71.239;
  r.probability.breakevens = {104.0049};

  json j = codec::toJson(r);
  EXPECT_FALSE(j["passed"].get<bool>());
  ASSERT_EQ(j["checks"].size(), 2u);
  EXPECT_EQ(j["checks"][0]["check_name"], "delta_limit");
  EXPECT_EQ(j["checks"][0]["level"], "BLOCKER");
  EXPECT_DOUBLE_EQ(j["checks"][0]["current_value"].get<double>(), 250.46);
  EXPECT_FALSE(j["checks"][1].contains("current_value"));
  EXPECT_FALSE(j["checks"][1].contains("limit_value"));

  EXPECT_EQ(j["strategy_info"]["type"], "short_call");
  EXPECT_EQ(j["strategy_info"]["max_loss"], codec::kUnlimited);
  EXPECT_DOUBLE_EQ(j["strategy_info"]["max_profit"].get<double>(), 400.0);
  EXPECT_DOUBLE_EQ(j["strategy_info"]["estimated_cost"].get<double>(), -400.0);

  EXPECT_DOUBLE_EQ(j["greeks_impact"]["combined"]["gamma"].get<double>(),
                   0.1235);
  EXPECT_DOUBLE_EQ(j["greeks_impact"]["combined"]["delta"].get<double>(),
                   -12.35);
  EXPECT_DOUBLE_EQ(
      j["probability_analysis"]["pop_expiration"].get<double>(), 71.24);
  EXPECT_DOUBLE_EQ(
      j["probability_analysis"]["breakeven_prices"][0].get<double>(), 104.0);
}

// -----------------------------------------------------------------------------
// 9. Transactions: fee optional, required fields enforced.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecodesTransactions) {
  json j{{"transactions",
          {{{"symbol", "AAPL"}, {"side", "buy"}, {"quantity", 10},
            {"price", 150.0}, {"timestamp_ms", 1}},
           {{"symbol", "AAPL"}, {"side", "sell"}, {"quantity", 5},
            {"price", 160.0}, {"fee", 1.5}, {"timestamp_ms", 2}}}}};
  auto txs = codec::transactionsFromJson(j);
  ASSERT_EQ(txs.size(), 2u);
  EXPECT_DOUBLE_EQ(txs[0].fee, 0.0);
  EXPECT_EQ(txs[1].side, Side::Sell);
  EXPECT_DOUBLE_EQ(txs[1].fee, 1.5);

  json bad{{"transactions", {{{"symbol", "AAPL"}, {"side", "buy"}}}}};
  EXPECT_THROW(codec::transactionsFromJson(bad), InputError);
}

// -----------------------------------------------------------------------------
// 10. Ledger snapshot encoding carries every field.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, EncodesLedger) {
  optrisk::LedgerSnapshot snap;
  snap.positions.push_back({"AAPL", 30.0, 7800.0, 260.0});
  snap.realized.push_back({"AAPL", 2200.0, 1});
  snap.total_realized = 2200.0;
  snap.total_trades = 1;

  json j = codec::toJson(snap);
  EXPECT_EQ(j["positions_count"], 1);
  EXPECT_EQ(j["total_trades"], 1);
  EXPECT_DOUBLE_EQ(j["total_realized"].get<double>(), 2200.0);
  EXPECT_EQ(j["positions"][0]["symbol"], "AAPL");
  EXPECT_DOUBLE_EQ(j["positions"][0]["average_cost"].get<double>(), 260.0);
  EXPECT_EQ(j["realized_pnl"][0]["trades"], 1);
}

// -----------------------------------------------------------------------------
// 11. Payoff curve encodes as an array of {price, pnl}.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, EncodesCurve) {
  std::vector<optrisk::PnlPoint> curve{{90.0, -100.123}, {110.0, 250.0}};
  json j = codec::toJson(curve);
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_DOUBLE_EQ(j[0]["pnl"].get<double>(), -100.12);
  EXPECT_DOUBLE_EQ(j[1]["price"].get<double>(), 110.0);
}
