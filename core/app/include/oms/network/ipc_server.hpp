#pragma once

#include "oms/concurrent/thread_safe_queue.hpp"
#include "oms/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace oms {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers command requests from
//         external clients (REP socket) and broadcasts order lifecycle
//         telemetry to subscribers (PUB socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (IpcConfig::cmd_endpoint):
//      Each request is a JSON command (or a bare word such as "PING") passed
//      to the command handler, bound to OrderManagementEngine::
//      executeCommand(). Every request gets exactly one reply; a handler that
//      throws is answered with an INTERNAL_ERROR object.
//
//   2. PUB socket (IpcConfig::pub_endpoint, optional):
//      Publishes one JSON message per OrderUpdateEvent, ExecutionReportEvent,
//      SliceUpdateEvent, VenueFailureEvent and ComplianceRejectEvent, in the
//      format produced by codec::telemetryJson(). Events arrive through a
//      ThreadSafeQueue so serialization and socket I/O stay off the
//      dispatcher and scheduler threads. With an empty endpoint no PUB
//      socket is opened and pushTelemetry() discards.
//
// The worker waits on the REP socket with zmq::poll for at most
// kPollTimeoutMs, so telemetry latency is bounded by that timeout while no
// command arrives.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread.
//
// Ownership:
//   Owned by OrderManagementEngine via std::unique_ptr. Owns the ZMQ
//   context, both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened and no thread is spawned until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker thread.
  // Idempotent. Throws zmq::error_t when an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it (within kPollTimeoutMs), closes the
  // sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // Endpoints actually bound (wildcard ports resolved). Empty before start()
  // and for a disabled PUB socket.
  std::string boundCommandEndpoint() const;
  std::string boundTelemetryEndpoint() const;

  // Telemetry line for `event`, or std::nullopt for internal events.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void publishPending();
  void answer();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  std::string bound_cmd_endpoint_;
  std::string bound_pub_endpoint_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace oms
