#pragma once

#include "optrisk/domain/greeks.hpp"
#include "optrisk/domain/option_leg.hpp"
#include "optrisk/domain/transaction.hpp"
#include "optrisk/domain/validation_result.hpp"
#include "optrisk/ledger/lot_ledger.hpp"
#include "optrisk/probability/payoff_profile.hpp"
#include "optrisk/risk/risk_validator.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace optrisk {
namespace codec {

// -----------------------------------------------------------------------------
// JSON codec — wire format of the validation and ledger services
// -----------------------------------------------------------------------------
//
// @brief  Converts between nlohmann::json documents and the engine's value
//         types.
//
// @details
// Decoding:
//   Every required field is looked up explicitly; a missing one raises
//   InputError naming it. Values of the wrong JSON type surface as
//   nlohmann::json::type_error. Domain validation (positive strike, known
//   enum names, ISO dates) happens in the value factories, so decoded
//   objects are always valid.
//
// Encoding:
//   Money and probabilities are rounded to 2 decimals and gamma to 4; this
//   is the only place rounding happens. Unbounded amounts are written as the
//   string "unlimited". Optional check values are omitted when absent.
// -----------------------------------------------------------------------------

constexpr const char* kUnlimited = "unlimited";

// Leg: {symbol, option_type, action, strike, expiry, quantity, premium,
//       volatility, current_price}
domain::OptionLeg legFromJson(const nlohmann::json& j);
nlohmann::json toJson(const domain::OptionLeg& leg);

// Request: {new_legs, existing_legs?, portfolio_cash, risk_profile?,
//           iv_rank?, iv_history?, valuation_date? | valuation_ms?}
ValidationRequest requestFromJson(const nlohmann::json& j);

nlohmann::json toJson(const domain::GreeksVector& g);
nlohmann::json toJson(const domain::RiskCheck& check);
nlohmann::json toJson(const domain::ValidationResult& result);

// Transaction: {symbol, side, quantity, price, fee?, timestamp_ms}
domain::Transaction transactionFromJson(const nlohmann::json& j);
std::vector<domain::Transaction> transactionsFromJson(const nlohmann::json& j);

nlohmann::json toJson(const LedgerSnapshot& snapshot);
nlohmann::json toJson(const std::vector<PnlPoint>& curve);

// Rounding helpers used by the encoders.
double round2(double v);
double round4(double v);

}  // namespace codec
}  // namespace optrisk
