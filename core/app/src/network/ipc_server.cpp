#include "escrow/network/ipc_server.hpp"
#include "escrow/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <iostream>
#include <utility>

namespace escrow {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind both sockets, then spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);

  try {
    cmd_socket_->bind(cmd_endpoint_);
    pub_socket_->bind(pub_endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] ERROR: bind failed (CMD=" << cmd_endpoint_
              << " PUB=" << pub_endpoint_ << "): " << e.what() << "\n";
    closeSockets();
    throw;
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): clear the flag, join, close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);

  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  closeSockets();

  std::cout << "[IpcServer] stopped. Served " << requests_served_.load()
            << " command(s).\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::closeSockets() {
  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();
}

// -----------------------------------------------------------------------------
// run(): wait up to kPollTimeoutMs for a command, then flush telemetry
// -----------------------------------------------------------------------------
void IpcServer::run() {
  zmq::pollitem_t items[] = {{cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};

  while (running_.load()) {
    try {
      zmq::poll(items, 1, std::chrono::milliseconds(kPollTimeoutMs));
    } catch (const zmq::error_t& e) {
      if (e.num() != EINTR) {
        throw;
      }
      continue;
    }

    if ((items[0].revents & ZMQ_POLLIN) != 0) {
      serveOneCommand();
    }
    flushTelemetry();
  }

  flushTelemetry();
}

// -----------------------------------------------------------------------------
// serveOneCommand(): REP contract is one recv followed by exactly one send
// -----------------------------------------------------------------------------
void IpcServer::serveOneCommand() {
  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  const std::string reply = command_handler_(request.to_string());
  cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none);
  requests_served_.fetch_add(1);
}

void IpcServer::flushTelemetry() {
  for (const Event& event : telemetry_queue_.drain()) {
    const std::string payload = formatTelemetry(event);
    pub_socket_->send(zmq::buffer(payload), zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// formatTelemetry(): each alternative has an ADL to_json in json_codec
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) {
        nlohmann::json j = e;
        return j.dump();
      },
      event);
}

}  // namespace escrow
