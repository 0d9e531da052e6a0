#pragma once

#include "optrisk/domain/types.hpp"

#include <cstdint>
#include <string>

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// Transaction — one executed buy or sell of an instrument
// -----------------------------------------------------------------------------
//
// @brief  Immutable record consumed by the lot ledger.
//
// @details
// quantity and price are strictly positive and fee is non-negative; these
// are checked once in create() so that the ledger never has to re-validate.
// timestamp_ms orders the history. Equal timestamps keep their input order.
//
// Thread model:
//   Value type. Safe to copy across threads.
// -----------------------------------------------------------------------------
struct Transaction {
  std::string symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  double fee{0.0};
  std::int64_t timestamp_ms{0};

  // -------------------------------------------------------------------------
  // create(...)
  // -------------------------------------------------------------------------
  // @brief  Validating factory.
  //
  // @throws InputError on empty symbol, quantity <= 0, price <= 0, fee < 0,
  //         or a non-finite number.
  // -------------------------------------------------------------------------
  static Transaction create(std::string symbol, Side side, double quantity,
                            double price, double fee,
                            std::int64_t timestamp_ms);
};

}  // namespace domain
}  // namespace optrisk
