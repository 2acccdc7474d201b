#include "optrisk/network/ipc_server.hpp"
#include "optrisk/domain/position_json.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace optrisk {

namespace {

std::string formatPositionOpened(const PositionOpenedEvent& e) {
  nlohmann::json j = domain::positionToJson(e.position);
  j["type"] = "position_opened";
  j["hydrated"] = e.hydrated;
  return j.dump();
}

std::string formatExit(const ExitNotificationEvent& e) {
  nlohmann::json j;
  j["type"] = "exit";
  j["position_id"] = e.position.id;
  j["segment"] = e.position.instrument.segment;
  j["security_id"] = e.position.instrument.security_id;
  j["index_key"] = e.position.index_key;
  j["side"] = domain::sideToString(e.position.side);
  j["reason"] = e.reason;
  j["exit_price"] = e.exit_price;
  j["entry_price"] = e.position.entry_price;
  j["quantity"] = e.position.quantity;
  j["pnl"] = e.pnl;
  j["pnl_pct"] = e.pnl_pct;
  j["peak_profit_pct"] = e.peak_profit_pct;
  j["exited_at_ms"] = e.exited_at_ms;
  return j.dump();
}

std::string formatExitFailed(const ExitFailedEvent& e) {
  nlohmann::json j;
  j["type"] = "exit_failed";
  j["position_id"] = e.position_id;
  j["segment"] = e.instrument.segment;
  j["security_id"] = e.instrument.security_id;
  j["reason"] = e.reason;
  j["error"] = e.error;
  j["failed_at_ms"] = e.failed_at_ms;
  return j.dump();
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
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

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): bounded recv, dispatch, always reply
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] Command '" << cmd << "' failed: " << e.what()
              << "\n";
    nlohmann::json err;
    err["status"] = "error";
    err["message"] = e.what();
    response = err.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<PositionOpenedEvent>(&event)) {
    return formatPositionOpened(*e);
  }
  if (auto* e = std::get_if<ExitNotificationEvent>(&event)) {
    return formatExit(*e);
  }
  if (auto* e = std::get_if<ExitFailedEvent>(&event)) {
    return formatExitFailed(*e);
  }
  return std::nullopt;
}

}  // namespace optrisk
