#pragma once

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace optrisk {

// -----------------------------------------------------------------------------
// ValidationServer — ZeroMQ request/reply front end
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that accepts JSON command envelopes on a
//         REP socket and replies with the handler's JSON response.
//
// @details
// One REP socket, bound to the configured endpoint. The socket uses
// ZMQ_RCVTIMEO so the worker wakes up every kPollTimeoutMs to check the
// running flag; stop() therefore returns within one poll interval.
//
// Every received message is passed to command_handler_ as a string and the
// returned string is sent back verbatim. The handler must not throw: a REP
// socket that fails to reply is stuck until it is recreated.
//
// Thread model:
//   Constructed and destroyed on the owning thread (via ValidationEngine).
//   start() spawns the worker; stop() clears the atomic flag and joins.
//   command_handler_ runs on the worker thread.
//
// Ownership:
//   Owned by ValidationEngine via std::unique_ptr.
//   Owns the ZMQ context, the socket and the worker thread.
// -----------------------------------------------------------------------------
class ValidationServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Stores parameters for deferred socket creation.
  //
  // @param  command_handler  Callback invoked for each request. Typically
  //                          bound to ValidationEngine::executeCommand().
  // @param  endpoint         ZMQ endpoint for the REP socket.
  //
  // Side-effects: None. No socket is opened until start().
  // -------------------------------------------------------------------------
  explicit ValidationServer(CommandHandler command_handler,
                            std::string endpoint = "tcp://127.0.0.1:5556");

  // RAII: calls stop() if the worker is still running.
  ~ValidationServer();

  ValidationServer(const ValidationServer&) = delete;
  ValidationServer& operator=(const ValidationServer&) = delete;
  ValidationServer(ValidationServer&&) = delete;
  ValidationServer& operator=(ValidationServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Creates the context, binds the REP socket and spawns the worker.
  //
  // Idempotent: calling start() when already running is a no-op.
  //
  // @throws zmq::error_t if the endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Signals the worker to exit, joins it and closes the socket.
  //
  // Idempotent: safe to call multiple times or if never started.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_.load(); }

  const std::string& endpoint() const { return endpoint_; }

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker entry point: processCommands() until running_ is cleared.
  void run();

  // -------------------------------------------------------------------------
  // processCommands()
  // -------------------------------------------------------------------------
  //
  // @brief  Waits up to kPollTimeoutMs for one request and answers it.
  //
  // @details
  // A timeout or EINTR returns without replying (nothing was received).
  // Any other ZMQ error is logged and ends the worker loop.
  // -------------------------------------------------------------------------
  void processCommands();

  CommandHandler command_handler_;
  std::string endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace optrisk
