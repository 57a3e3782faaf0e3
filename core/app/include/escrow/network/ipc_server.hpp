#pragma once

#include "escrow/concurrent/thread_safe_queue.hpp"
#include "escrow/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace escrow {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry endpoint of the escrow node
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread that answers JSON commands on a REP socket
//         and broadcasts committed engine events on a PUB socket.
//
// @details
// Sockets:
//
//   1. REP (cmd_endpoint, default tcp://127.0.0.1:5556)
//      Each request is a JSON command string. It is passed to the command
//      handler (EscrowNode::executeCommand) and the returned JSON string is
//      sent back. The worker polls with a kPollTimeoutMs timeout so it
//      notices stop() and flushes telemetry between commands.
//
//   2. PUB (pub_endpoint, default tcp://127.0.0.1:5557)
//      Every Event pushed with pushTelemetry() is serialized to JSON (see
//      network/json_codec.hpp) and published without a topic prefix.
//
// Serialization of engine calls:
//   The command handler only ever runs on the worker thread, one request at
//   a time (REP enforces strict request/reply alternation). This is what
//   gives the single-threaded EscrowEngine its serialized caller.
//
// Thread model:
//   Constructed and destroyed on the owning thread (main, via EscrowNode).
//   start() opens the sockets and spawns the worker; stop() joins it.
//   pushTelemetry() may be called from any thread.
//
// Ownership:
//   Owned by EscrowNode via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // Stores the handler and endpoints. No socket is opened until start().
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: stops the worker if still running.
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker thread.
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Signals the worker, joins it (within kPollTimeoutMs), then closes the
  // sockets. Telemetry still queued is published before the worker exits.
  // Idempotent; safe if never started.
  //
  // If start() threw on bind, the sockets are already closed and stop() is
  // a no-op.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues an event for the PUB socket. Safe from any thread.
  void pushTelemetry(Event event);

  bool isRunning() const { return running_.load(); }

  // Number of commands answered since construction.
  std::uint64_t requestsServed() const { return requests_served_.load(); }

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // JSON text published on the PUB socket for `event`. Pure function.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: poll for one command, flush telemetry, repeat until stopped.
  void run();

  void serveOneCommand();
  void flushTelemetry();
  void closeSockets();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> requests_served_{0};
};

}  // namespace escrow
