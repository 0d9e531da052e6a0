#include "optrisk/engine/validation_engine.hpp"
#include "optrisk/codec/json_codec.hpp"
#include "optrisk/domain/errors.hpp"
#include "optrisk/probability/payoff_profile.hpp"
#include "optrisk/time/time_utils.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace optrisk {

using nlohmann::json;

namespace {

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ValidationEngine::ValidationEngine(EngineConfig config,
                                   const ITimeProvider& clock)
    : config_(std::move(config)),
      clock_(clock),
      validator_(config_.limits, config_.pricing, clock_) {
  validateConfig(config_);
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
ValidationEngine::~ValidationEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ValidationEngine::start() {
  if (running_) {
    return;
  }

  // Skip the socket if no endpoint was configured (unit tests call
  // executeCommand() directly).
  if (!config_.endpoint.empty()) {
    server_ = std::make_unique<ValidationServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.endpoint);
    server_->start();
  }

  running_ = true;

  std::cout << "[ValidationEngine] started"
            << (server_ ? " on " + config_.endpoint : std::string(" (no IPC)"))
            << ". max_delta=" << config_.limits.max_delta
            << " r=" << config_.pricing.risk_free_rate << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ValidationEngine::stop() {
  if (!running_) {
    return;
  }

  // Joins the worker before any member it calls into can go away.
  server_.reset();

  running_ = false;

  std::cout << "[ValidationEngine] stopped.\n";
}

std::size_t ValidationEngine::journalSize() const {
  std::lock_guard<std::mutex> lock(journal_mutex_);
  return journal_.size();
}

// -----------------------------------------------------------------------------
// executeCommand(): envelope decode, dispatch, error mapping
// -----------------------------------------------------------------------------
std::string ValidationEngine::executeCommand(const std::string& request) {
  json response;

  try {
    const std::string text = trim(request);
    std::string command;
    json payload;

    if (!text.empty() && text.front() == '{') {
      const json envelope = json::parse(text);
      auto cmd = envelope.find("command");
      if (cmd == envelope.end() || !cmd->is_string()) {
        throw InputError("request envelope needs a string 'command'");
      }
      command = cmd->get<std::string>();
      if (auto p = envelope.find("payload"); p != envelope.end()) {
        payload = *p;
      }
    } else {
      command = text;
    }

    response = dispatch(command, payload);
  } catch (const InputError& e) {
    std::cerr << "[ValidationEngine] rejected request: " << e.what() << "\n";
    response = errorResponse(e.what());
  } catch (const OversellError& e) {
    std::cerr << "[ValidationEngine] rejected transaction: " << e.what()
              << "\n";
    response = errorResponse(e.what());
  } catch (const json::exception& e) {
    std::cerr << "[ValidationEngine] malformed JSON: " << e.what() << "\n";
    response = errorResponse(std::string("malformed request: ") + e.what());
  } catch (const std::exception& e) {
    // Anything else still gets a reply; the server thread keeps running.
    std::cerr << "[ValidationEngine] command failed: " << e.what() << "\n";
    response = errorResponse(std::string("internal error: ") + e.what());
  }

  return response.dump();
}

json ValidationEngine::dispatch(const std::string& command,
                                const json& payload) {
  if (command == "PING") {
    return json{{"status", "ok"}, {"response", "PONG"}};
  }
  if (command == "VALIDATE") {
    return handleValidate(payload);
  }
  if (command == "POSITIONS") {
    return handlePositions(payload);
  }
  if (command == "RECORD") {
    return handleRecord(payload);
  }
  if (command == "PAYOFF") {
    return handlePayoff(payload);
  }
  return errorResponse("Unknown command: " + command);
}

// -----------------------------------------------------------------------------
// VALIDATE
// -----------------------------------------------------------------------------
json ValidationEngine::handleValidate(const json& payload) const {
  const ValidationRequest req = codec::requestFromJson(payload);
  const domain::ValidationResult result = validator_.validate(req);

  std::cout << "[ValidationEngine] VALIDATE "
            << domain::toString(result.classification.type) << " with "
            << req.new_legs.size() << " leg(s): "
            << (result.passed ? "passed" : "blocked") << "\n";

  return json{{"status", "ok"}, {"result", codec::toJson(result)}};
}

// -----------------------------------------------------------------------------
// POSITIONS: stateless fold of the supplied list, or of the journal
// -----------------------------------------------------------------------------
json ValidationEngine::handlePositions(const json& payload) const {
  LedgerSnapshot snapshot;
  if (payload.is_null()) {
    std::lock_guard<std::mutex> lock(journal_mutex_);
    snapshot = journal_.recomputePositions();
  } else {
    snapshot = LotLedger::fold(codec::transactionsFromJson(payload));
  }
  return json{{"status", "ok"}, {"ledger", codec::toJson(snapshot)}};
}

// -----------------------------------------------------------------------------
// RECORD: append one transaction to the journal
// -----------------------------------------------------------------------------
json ValidationEngine::handleRecord(const json& payload) {
  const domain::Transaction tx = codec::transactionFromJson(payload);

  std::lock_guard<std::mutex> lock(journal_mutex_);
  journal_.applyTransaction(tx);

  std::cout << "[ValidationEngine] RECORD " << domain::toString(tx.side)
            << " " << tx.quantity << " " << tx.symbol << " @ " << tx.price
            << "\n";

  return json{{"status", "ok"}, {"journal_size", journal_.size()}};
}

// -----------------------------------------------------------------------------
// PAYOFF: P&L curve at the earliest expiry, default ±50% around spot
// -----------------------------------------------------------------------------
json ValidationEngine::handlePayoff(const json& payload) const {
  if (!payload.is_object()) {
    throw InputError("PAYOFF needs a payload with 'legs'");
  }
  auto legs_it = payload.find("legs");
  if (legs_it == payload.end() || !legs_it->is_array()) {
    throw InputError("PAYOFF needs a 'legs' array");
  }

  std::vector<domain::OptionLeg> legs;
  for (const auto& leg : *legs_it) {
    legs.push_back(codec::legFromJson(leg));
  }
  if (legs.empty()) {
    throw InputError("PAYOFF needs at least one leg");
  }

  const double spot = legs.front().current_price;
  const double low = payload.value("low", spot * (1.0 - kDefaultPayoffSpan));
  const double high = payload.value("high", spot * (1.0 + kDefaultPayoffSpan));
  const double requested =
      payload.value("points", static_cast<double>(kDefaultPayoffPoints));

  if (!std::isfinite(high) || !(low >= 0.0) || !(high > low)) {
    throw InputError("PAYOFF range must satisfy 0 <= low < high");
  }
  // Checked as a double before the int cast.
  if (!(requested >= 2.0) || requested > kMaxPayoffPoints ||
      std::floor(requested) != requested) {
    throw InputError("PAYOFF points must be a whole number in [2, " +
                     std::to_string(kMaxPayoffPoints) + "]");
  }
  const int points = static_cast<int>(requested);

  PayoffProfile profile(std::move(legs), GreeksEngine(config_.pricing));
  return json{{"status", "ok"},
              {"horizon", format_iso_date(profile.horizonDay())},
              {"curve", codec::toJson(profile.sample(low, high, points))}};
}

json ValidationEngine::errorResponse(const std::string& message) {
  return json{{"status", "error"}, {"response", message}};
}

}  // namespace optrisk
