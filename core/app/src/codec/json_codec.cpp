#include "optrisk/codec/json_codec.hpp"
#include "optrisk/domain/errors.hpp"
#include "optrisk/time/time_utils.hpp"

#include <cmath>
#include <string>

namespace optrisk {
namespace codec {

using nlohmann::json;

namespace {

const json& require(const json& j, const char* key) {
  if (!j.is_object()) {
    throw InputError(std::string("expected a JSON object holding '") + key +
                     "'");
  }
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    throw InputError(std::string("missing required field '") + key + "'");
  }
  return *it;
}

json amount(double v) {
  if (domain::isUnbounded(v)) {
    return kUnlimited;
  }
  return round2(v);
}

}  // namespace

double round2(double v) { return std::round(v * 100.0) / 100.0; }

double round4(double v) { return std::round(v * 10000.0) / 10000.0; }

// -----------------------------------------------------------------------------
// Legs
// -----------------------------------------------------------------------------
domain::OptionLeg legFromJson(const json& j) {
  return domain::OptionLeg::create(
      require(j, "symbol").get<std::string>(),
      domain::parseOptionType(require(j, "option_type").get<std::string>()),
      domain::parseSide(require(j, "action").get<std::string>()),
      require(j, "strike").get<double>(),
      require(j, "expiry").get<std::string>(),
      require(j, "quantity").get<double>(),
      require(j, "premium").get<double>(),
      require(j, "volatility").get<double>(),
      require(j, "current_price").get<double>());
}

json toJson(const domain::OptionLeg& leg) {
  return json{{"symbol", leg.symbol},
              {"option_type", domain::toString(leg.type)},
              {"action", domain::toString(leg.action)},
              {"strike", leg.strike},
              {"expiry", leg.expiry},
              {"quantity", leg.quantity},
              {"premium", leg.premium},
              {"volatility", leg.volatility},
              {"current_price", leg.current_price}};
}

// -----------------------------------------------------------------------------
// requestFromJson(): optional fields keep their ValidationRequest defaults
// -----------------------------------------------------------------------------
ValidationRequest requestFromJson(const json& j) {
  ValidationRequest req;

  for (const auto& leg : require(j, "new_legs")) {
    req.new_legs.push_back(legFromJson(leg));
  }
  if (auto it = j.find("existing_legs"); it != j.end() && !it->is_null()) {
    for (const auto& leg : *it) {
      req.existing_legs.push_back(legFromJson(leg));
    }
  }

  req.portfolio_cash = require(j, "portfolio_cash").get<double>();

  if (auto it = j.find("risk_profile"); it != j.end() && !it->is_null()) {
    req.risk_profile = domain::parseRiskProfile(it->get<std::string>());
  }
  if (auto it = j.find("iv_rank"); it != j.end() && !it->is_null()) {
    req.iv_rank = it->get<double>();
  }
  if (auto it = j.find("iv_history"); it != j.end() && !it->is_null()) {
    req.iv_history = it->get<std::vector<double>>();
  }
  if (auto it = j.find("valuation_ms"); it != j.end() && !it->is_null()) {
    req.valuation_ms = it->get<std::int64_t>();
  } else if (auto d = j.find("valuation_date"); d != j.end() && !d->is_null()) {
    req.valuation_ms = epoch_day_to_ms(parse_iso_date(d->get<std::string>()));
  }

  return req;
}

// -----------------------------------------------------------------------------
// Results
// -----------------------------------------------------------------------------
json toJson(const domain::GreeksVector& g) {
  return json{{"delta", round2(g.delta)},
              {"gamma", round4(g.gamma)},
              {"theta", round2(g.theta)},
              {"vega", round2(g.vega)},
              {"rho", round2(g.rho)}};
}

json toJson(const domain::RiskCheck& check) {
  json j{{"check_name", check.name},
         {"level", domain::toString(check.level)},
         {"message", check.message}};
  if (check.current_value) {
    j["current_value"] = round2(*check.current_value);
  }
  if (check.limit_value) {
    j["limit_value"] = round2(*check.limit_value);
  }
  return j;
}

json toJson(const domain::ValidationResult& result) {
  json checks = json::array();
  for (const auto& c : result.checks) {
    checks.push_back(toJson(c));
  }

  const auto& cls = result.classification;
  json strategy{{"type", domain::toString(cls.type)},
                {"legs", cls.leg_count},
                {"estimated_cost", round2(cls.net_cost)},
                {"max_loss", amount(cls.max_loss)},
                {"max_profit", amount(cls.max_profit)}};

  json breakevens = json::array();
  for (double b : result.probability.breakevens) {
    breakevens.push_back(round2(b));
  }

  const auto& p = result.probability;
  json probability{{"pop_expiration", round2(p.pop_expiration)},
                   {"breakeven_prices", std::move(breakevens)},
                   {"profit_50_probability", round2(p.profit_50_probability)},
                   {"profit_25_probability", round2(p.profit_25_probability)},
                   {"current_price", round2(p.current_price)}};

  return json{{"passed", result.passed},
              {"checks", std::move(checks)},
              {"strategy_info", std::move(strategy)},
              {"greeks_impact",
               {{"current", toJson(result.greeks.current)},
                {"new_trade", toJson(result.greeks.new_trade)},
                {"combined", toJson(result.greeks.combined)}}},
              {"probability_analysis", std::move(probability)}};
}

// -----------------------------------------------------------------------------
// Ledger
// -----------------------------------------------------------------------------
domain::Transaction transactionFromJson(const json& j) {
  double fee = 0.0;
  if (auto it = j.find("fee"); it != j.end() && !it->is_null()) {
    fee = it->get<double>();
  }
  return domain::Transaction::create(
      require(j, "symbol").get<std::string>(),
      domain::parseSide(require(j, "side").get<std::string>()),
      require(j, "quantity").get<double>(), require(j, "price").get<double>(),
      fee, require(j, "timestamp_ms").get<std::int64_t>());
}

std::vector<domain::Transaction> transactionsFromJson(const json& j) {
  std::vector<domain::Transaction> out;
  for (const auto& tx : require(j, "transactions")) {
    out.push_back(transactionFromJson(tx));
  }
  return out;
}

json toJson(const LedgerSnapshot& snapshot) {
  json positions = json::array();
  for (const auto& p : snapshot.positions) {
    positions.push_back({{"symbol", p.symbol},
                         {"quantity", p.quantity},
                         {"cost_basis", round2(p.cost_basis)},
                         {"average_cost", round2(p.average_cost)}});
  }

  json realized = json::array();
  for (const auto& r : snapshot.realized) {
    realized.push_back({{"symbol", r.symbol},
                        {"realized", round2(r.realized)},
                        {"trades", r.trades}});
  }

  return json{{"positions", std::move(positions)},
              {"realized_pnl", std::move(realized)},
              {"total_realized", round2(snapshot.total_realized)},
              {"total_trades", snapshot.total_trades},
              {"positions_count", snapshot.positionsCount()}};
}

json toJson(const std::vector<PnlPoint>& curve) {
  json points = json::array();
  for (const auto& pt : curve) {
    points.push_back({{"price", round2(pt.price)}, {"pnl", round2(pt.pnl)}});
  }
  return points;
}

}  // namespace codec
}  // namespace optrisk
