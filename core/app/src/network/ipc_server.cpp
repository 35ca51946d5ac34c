#include "oms/network/ipc_server.hpp"
#include "oms/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <iostream>
#include <utility>

namespace oms {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  bound_cmd_endpoint_ = cmd_socket_->get(zmq::sockopt::last_endpoint);

  if (!pub_endpoint_.empty()) {
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
    pub_socket_->set(zmq::sockopt::linger, 0);
    pub_socket_->bind(pub_endpoint_);
    bound_pub_endpoint_ = pub_socket_->get(zmq::sockopt::last_endpoint);
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening for commands on " << bound_cmd_endpoint_
            << ", telemetry "
            << (pub_socket_ ? bound_pub_endpoint_ : std::string("disabled"))
            << "\n";
}

void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();
  bound_cmd_endpoint_.clear();
  bound_pub_endpoint_.clear();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  if (pub_endpoint_.empty()) {
    return;
  }
  if (!telemetry_queue_.push(std::move(event))) {
    std::cerr << "[IpcServer] WARNING: telemetry queue closed, event dropped\n";
  }
}

std::string IpcServer::boundCommandEndpoint() const {
  return bound_cmd_endpoint_;
}

std::string IpcServer::boundTelemetryEndpoint() const {
  return bound_pub_endpoint_;
}

// -----------------------------------------------------------------------------
// run(): publish what is queued, then wait for at most one command
// -----------------------------------------------------------------------------
void IpcServer::run() {
  zmq::pollitem_t items[] = {
      {cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};

  while (running_.load()) {
    publishPending();

    try {
      zmq::poll(items, 1, std::chrono::milliseconds(kPollTimeoutMs));
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }
    if (items[0].revents & ZMQ_POLLIN) {
      answer();
    }
  }

  // Last lifecycle updates still reach subscribers.
  publishPending();
}

void IpcServer::publishPending() {
  if (!pub_socket_) {
    return;
  }
  while (auto event = telemetry_queue_.try_pop()) {
    const auto line = formatTelemetry(*event);
    if (!line) {
      continue;
    }
    if (!pub_socket_->send(zmq::buffer(*line), zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] WARNING: telemetry send would block, "
                   "message dropped\n";
    }
  }
}

// -----------------------------------------------------------------------------
// answer(): one request, exactly one reply
// -----------------------------------------------------------------------------
void IpcServer::answer() {
  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  std::string response;
  try {
    response = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: command handler failed: " << e.what()
              << "\n";
    nlohmann::json err;
    err["status"] = "error";
    err["error_type"] = "INTERNAL_ERROR";
    err["message"] = e.what();
    response = err.dump();
  }

  cmd_socket_->send(zmq::buffer(response), zmq::send_flags::none);
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  auto j = codec::telemetryJson(event);
  if (!j.has_value()) {
    return std::nullopt;
  }
  return j->dump();
}

}  // namespace oms
