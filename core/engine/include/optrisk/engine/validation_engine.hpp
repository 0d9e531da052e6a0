#pragma once

#include "optrisk/config/engine_config.hpp"
#include "optrisk/ledger/transaction_journal.hpp"
#include "optrisk/network/validation_server.hpp"
#include "optrisk/risk/risk_validator.hpp"
#include "optrisk/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// ValidationEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the service. Owns the validator, the
//         transaction journal and the optional ZeroMQ server, and turns JSON
//         command envelopes into JSON responses.
//
// @details
// Request envelope:
//
//   { "command": "<NAME>", "payload": { ... } }
//
// A bare command word ("PING") is accepted as an envelope with no payload.
//
// Commands:
//   PING       → {"status":"ok","response":"PONG"}
//   VALIDATE   payload = validation request
//              → {"status":"ok","result":{passed, checks, ...}}
//   POSITIONS  payload = {"transactions":[...]} folds that list;
//              no payload folds the engine's own journal
//              → {"status":"ok","ledger":{positions, realized_pnl, ...}}
//   RECORD     payload = one transaction, appended to the journal
//              → {"status":"ok","journal_size":n}
//   PAYOFF     payload = {"legs":[...], "low"?, "high"?, "points"?}
//              → {"status":"ok","horizon":"YYYY-MM-DD","curve":[...]}
//
// Every failure, whether malformed JSON, a wrong field type, an invalid leg
// or an oversell, is returned as {"status":"error","response":"<message>"}.
// executeCommand() never throws, so the REP socket always gets a reply.
//
// Thread model:
//   Constructed, started and stopped on the caller's thread (main).
//   executeCommand() runs on the server worker, or directly on the caller's
//   thread in tests. The journal is guarded by journal_mutex_; everything
//   else is immutable after construction.
//
// Ownership:
//   ValidationEngine
//    ├── config_      (EngineConfig — value member)
//    ├── clock_       (const ITimeProvider& — non-owning ref)
//    ├── validator_   (RiskValidator — value member)
//    ├── journal_     (TransactionJournal — value member)
//    └── server_      (unique_ptr<ValidationServer>)
//
// server_ is declared last so it is destroyed first: its worker calls back
// into executeCommand() and must be joined before the members it touches.
// -----------------------------------------------------------------------------
class ValidationEngine {
 public:
  static constexpr int kDefaultPayoffPoints = 101;
  static constexpr int kMaxPayoffPoints = 10'000;
  static constexpr double kDefaultPayoffSpan = 0.5;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config  Limits, pricing parameters and endpoint. Validated here.
  // @param  clock   Valuation clock. Must outlive the engine.
  //
  // @throws ConfigError if config fails validateConfig().
  // -------------------------------------------------------------------------
  ValidationEngine(EngineConfig config, const ITimeProvider& clock);

  // RAII: stop() if still running.
  ~ValidationEngine();

  ValidationEngine(const ValidationEngine&) = delete;
  ValidationEngine& operator=(const ValidationEngine&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Bring the ZeroMQ server up or down. With an empty endpoint
  //         start() only marks the engine running.
  //
  // Both are idempotent.
  //
  // @throws zmq::error_t from start() if the endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();
  void stop();

  bool isRunning() const { return running_; }

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Decodes one envelope, dispatches it and encodes the response.
  //
  // @return JSON-formatted response string. Never throws.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  const EngineConfig& config() const { return config_; }

  std::size_t journalSize() const;

 private:
  nlohmann::json dispatch(const std::string& command,
                          const nlohmann::json& payload);

  nlohmann::json handleValidate(const nlohmann::json& payload) const;
  nlohmann::json handlePositions(const nlohmann::json& payload) const;
  nlohmann::json handleRecord(const nlohmann::json& payload);
  nlohmann::json handlePayoff(const nlohmann::json& payload) const;

  static nlohmann::json errorResponse(const std::string& message);

  EngineConfig config_;
  const ITimeProvider& clock_;
  RiskValidator validator_;

  mutable std::mutex journal_mutex_;
  TransactionJournal journal_;

  bool running_{false};
  std::unique_ptr<ValidationServer> server_;
};

}  // namespace optrisk
