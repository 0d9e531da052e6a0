#pragma once

#include "optrisk/domain/risk_limits.hpp"
#include "optrisk/pricing/pricing_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// EngineConfig — everything the server needs at startup
// -----------------------------------------------------------------------------
//
// @brief  Risk limits, pricing parameters and the command endpoint.
//
// @details
// File layout (every key optional, missing keys keep the defaults):
//
//   {
//     "server":      { "endpoint": "tcp://127.0.0.1:5556" },
//     "pricing":     { "risk_free_rate": 0.05, "dividend_yield": 0.0 },
//     "risk_limits": { "max_delta": 200, "max_gamma": 20, ... }
//   }
//
// An empty endpoint disables the ZeroMQ server; the engine then only
// answers executeCommand() calls made in-process (unit tests).
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::RiskLimits limits{};
  PricingConfig pricing{};
  std::string endpoint{"tcp://127.0.0.1:5556"};
};

// -------------------------------------------------------------------------
// loadEngineConfig(path)
// -------------------------------------------------------------------------
// @brief  Reads and validates a JSON config file.
//
// @throws ConfigError if the file cannot be opened, is not valid JSON,
//         holds a value of the wrong type, or fails validateConfig().
// -------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

// Same as loadEngineConfig() for an already parsed document.
EngineConfig engineConfigFromJson(const nlohmann::json& doc);

// -------------------------------------------------------------------------
// validateConfig(config)
// -------------------------------------------------------------------------
// @brief  Range checks: Greeks caps > 0, fractions in (0, 1], PoP floors
//         and IV rank in [0, 100], concentration counts >= 1, rates finite.
//
// @throws ConfigError naming the first offending key.
// -------------------------------------------------------------------------
void validateConfig(const EngineConfig& config);

}  // namespace optrisk
