#include "optrisk/network/validation_server.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace optrisk {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
ValidationServer::ValidationServer(CommandHandler command_handler,
                                   std::string endpoint)
    : command_handler_(std::move(command_handler)),
      endpoint_(std::move(endpoint)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
ValidationServer::~ValidationServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create socket and spawn worker thread
// -----------------------------------------------------------------------------
void ValidationServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);

  socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->bind(endpoint_);

  running_.store(true);

  thread_ = std::thread([this] { run(); });

  std::cout << "[ValidationServer] started. CMD=" << endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void ValidationServer::stop() {
  const bool was_running = running_.exchange(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  if (!was_running && !socket_) {
    return;
  }

  socket_.reset();
  context_.reset();

  std::cout << "[ValidationServer] stopped.\n";
}

// -----------------------------------------------------------------------------
// run(): poll loop
// -----------------------------------------------------------------------------
void ValidationServer::run() {
  while (running_.load()) {
    processCommands();
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void ValidationServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    std::cerr << "[ValidationServer] recv failed: " << e.what()
              << ". Worker exiting.\n";
    running_.store(false);
    return;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  try {
    socket_->send(reply, zmq::send_flags::none);
  } catch (const zmq::error_t& e) {
    std::cerr << "[ValidationServer] send failed: " << e.what()
              << ". Worker exiting.\n";
    running_.store(false);
  }
}

}  // namespace optrisk
