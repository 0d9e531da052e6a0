#pragma once

#include <stdexcept>
#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exceptions raised for structural problems only. Business-rule
//         failures (a trade that breaches a limit) are never exceptions; they
//         are reported as RiskCheck entries inside a ValidationResult.
//
// @details
//   InputError    Malformed leg, transaction, or request: non-positive
//                 quantity/strike/price, negative fee, empty symbol, unknown
//                 enum string, bad date. Raised at construction time so no
//                 partial computation ever starts.
//
//   OversellError A SELL asks for more than the open lots of its symbol
//                 hold. The ledger refuses to invent short lots.
//
//   ConfigError   The engine configuration file is unreadable or holds a
//                 value outside its legal range.
// -----------------------------------------------------------------------------
class InputError : public std::invalid_argument {
 public:
  explicit InputError(const std::string& what) : std::invalid_argument(what) {}
};

class OversellError : public std::runtime_error {
 public:
  OversellError(const std::string& symbol, double requested, double held)
      : std::runtime_error("Oversell on " + symbol + ": sell quantity " +
                           std::to_string(requested) + " exceeds held " +
                           std::to_string(held)),
        symbol_(symbol),
        requested_(requested),
        held_(held) {}

  const std::string& symbol() const { return symbol_; }
  double requested() const { return requested_; }
  double held() const { return held_; }

 private:
  std::string symbol_;
  double requested_;
  double held_;
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace optrisk
