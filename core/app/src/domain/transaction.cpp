#include "optrisk/domain/transaction.hpp"
#include "optrisk/domain/errors.hpp"

#include <cmath>
#include <utility>

namespace optrisk {
namespace domain {

Transaction Transaction::create(std::string symbol, Side side, double quantity,
                                double price, double fee,
                                std::int64_t timestamp_ms) {
  if (symbol.empty()) {
    throw InputError("transaction symbol must not be empty");
  }
  if (!std::isfinite(quantity) || quantity <= 0.0) {
    throw InputError("transaction quantity must be positive for " + symbol);
  }
  if (!std::isfinite(price) || price <= 0.0) {
    throw InputError("transaction price must be positive for " + symbol);
  }
  if (!std::isfinite(fee) || fee < 0.0) {
    throw InputError("transaction fee must be non-negative for " + symbol);
  }

  Transaction tx;
  tx.symbol = std::move(symbol);
  tx.side = side;
  tx.quantity = quantity;
  tx.price = price;
  tx.fee = fee;
  tx.timestamp_ms = timestamp_ms;
  return tx;
}

}  // namespace domain
}  // namespace optrisk
