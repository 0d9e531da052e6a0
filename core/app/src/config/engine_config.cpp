#include "optrisk/config/engine_config.hpp"
#include "optrisk/domain/errors.hpp"

#include <cmath>
#include <fstream>

namespace optrisk {

using nlohmann::json;

namespace {

// Overwrites target with doc[key] when present. Type mismatches become
// ConfigError so callers only ever see one exception type.
template <typename T>
void readOptional(const json& section, const char* key, T& target) {
  auto it = section.find(key);
  if (it == section.end() || it->is_null()) {
    return;
  }
  try {
    target = it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(std::string("config key '") + key +
                      "' has the wrong type: " + e.what());
  }
}

const json* section(const json& doc, const char* name) {
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config section '") + name +
                      "' must be an object");
  }
  return &*it;
}

void requirePositive(double v, const char* key) {
  if (!std::isfinite(v) || v <= 0.0) {
    throw ConfigError(std::string(key) + " must be a positive number");
  }
}

void requireFraction(double v, const char* key) {
  if (!std::isfinite(v) || v <= 0.0 || v > 1.0) {
    throw ConfigError(std::string(key) + " must lie in (0, 1]");
  }
}

void requirePercent(double v, const char* key) {
  if (!std::isfinite(v) || v < 0.0 || v > 100.0) {
    throw ConfigError(std::string(key) + " must lie in [0, 100]");
  }
}

void requireCount(int v, const char* key) {
  if (v < 1) {
    throw ConfigError(std::string(key) + " must be at least 1");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// loadEngineConfig(): file → json → EngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }

  json doc;
  try {
    in >> doc;
  } catch (const json::parse_error& e) {
    throw ConfigError("config file '" + path + "' is not valid JSON: " +
                      e.what());
  }
  return engineConfigFromJson(doc);
}

EngineConfig engineConfigFromJson(const json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  EngineConfig cfg;

  if (const json* server = section(doc, "server")) {
    readOptional(*server, "endpoint", cfg.endpoint);
  }

  if (const json* pricing = section(doc, "pricing")) {
    readOptional(*pricing, "risk_free_rate", cfg.pricing.risk_free_rate);
    readOptional(*pricing, "dividend_yield", cfg.pricing.dividend_yield);
  }

  if (const json* limits = section(doc, "risk_limits")) {
    auto& l = cfg.limits;
    readOptional(*limits, "max_delta", l.max_delta);
    readOptional(*limits, "max_gamma", l.max_gamma);
    readOptional(*limits, "max_vega", l.max_vega);
    readOptional(*limits, "max_theta", l.max_theta);
    readOptional(*limits, "delta_warning_fraction", l.delta_warning_fraction);
    readOptional(*limits, "capital_warning_fraction",
                 l.capital_warning_fraction);
    readOptional(*limits, "min_pop_conservative", l.min_pop_conservative);
    readOptional(*limits, "min_pop_moderate", l.min_pop_moderate);
    readOptional(*limits, "min_pop_aggressive", l.min_pop_aggressive);
    readOptional(*limits, "min_iv_rank_for_credit", l.min_iv_rank_for_credit);
    readOptional(*limits, "max_legs_per_symbol", l.max_legs_per_symbol);
    readOptional(*limits, "max_legs_per_expiry", l.max_legs_per_expiry);
    readOptional(*limits, "max_legs_per_strike", l.max_legs_per_strike);
    readOptional(*limits, "early_assignment_days", l.early_assignment_days);
  }

  validateConfig(cfg);
  return cfg;
}

// -----------------------------------------------------------------------------
// validateConfig()
// -----------------------------------------------------------------------------
void validateConfig(const EngineConfig& config) {
  const auto& l = config.limits;
  requirePositive(l.max_delta, "max_delta");
  requirePositive(l.max_gamma, "max_gamma");
  requirePositive(l.max_vega, "max_vega");
  requirePositive(l.max_theta, "max_theta");
  requireFraction(l.delta_warning_fraction, "delta_warning_fraction");
  requireFraction(l.capital_warning_fraction, "capital_warning_fraction");
  requirePercent(l.min_pop_conservative, "min_pop_conservative");
  requirePercent(l.min_pop_moderate, "min_pop_moderate");
  requirePercent(l.min_pop_aggressive, "min_pop_aggressive");
  requirePercent(l.min_iv_rank_for_credit, "min_iv_rank_for_credit");
  requireCount(l.max_legs_per_symbol, "max_legs_per_symbol");
  requireCount(l.max_legs_per_expiry, "max_legs_per_expiry");
  requireCount(l.max_legs_per_strike, "max_legs_per_strike");
  if (l.early_assignment_days < 0) {
    throw ConfigError("early_assignment_days must not be negative");
  }

  if (!std::isfinite(config.pricing.risk_free_rate)) {
    throw ConfigError("risk_free_rate must be finite");
  }
  if (!std::isfinite(config.pricing.dividend_yield)) {
    throw ConfigError("dividend_yield must be finite");
  }
}

}  // namespace optrisk
