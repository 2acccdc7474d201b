#pragma once

#include "optrisk/concurrent/thread_safe_queue.hpp"
#include "optrisk/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace optrisk {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command (REP) and telemetry (PUB) sockets
// -----------------------------------------------------------------------------
//
// @brief  Lets dashboards and operators watch and steer the engine: commands
//         arrive on the REP socket, position and exit telemetry leaves on the
//         PUB socket.
//
// @details
// REP (default tcp://127.0.0.1:5556):
//   Each request is a command string handed to the command handler (bound to
//   RiskManager::executeCommand) and the JSON it returns is the reply. A REP
//   socket must answer every request, so a std::exception escaping the
//   handler is turned into {"status":"error","message":...}.
//
// PUB (default tcp://127.0.0.1:5557):
//   pushTelemetry() queues events from the notification loop; the IPC thread
//   formats and publishes them:
//
//     PositionOpenedEvent    → {"type":"position_opened", ...}
//     ExitNotificationEvent  → {"type":"exit", ...}
//     ExitFailedEvent        → {"type":"exit_failed", ...}
//
//   Other event types are ignored.
//
// Thread model:
//   start()/stop() on the owning thread. One worker thread alternates between
//   draining telemetry and a bounded recv on the REP socket.
//   pushTelemetry() from any thread.
//
// Ownership:
//   Owned by RiskManager via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op if already running.
  void start();

  // Joins the worker after a final telemetry drain. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return JSON text for the three telemetry types, std::nullopt otherwise.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace optrisk
