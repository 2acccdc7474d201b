#pragma once

#include "optrisk/concurrent/event_loop_thread.hpp"
#include "optrisk/concurrent/position_id_generator.hpp"
#include "optrisk/concurrent/sweep_thread.hpp"
#include "optrisk/config/engine_config.hpp"
#include "optrisk/domain/position.hpp"
#include "optrisk/eventbus/event_bus.hpp"
#include "optrisk/execution/i_order_router.hpp"
#include "optrisk/execution/paper_order_router.hpp"
#include "optrisk/network/ipc_server.hpp"
#include "optrisk/network/market_data_thread.hpp"
#include "optrisk/risk/exit_coordinator.hpp"
#include "optrisk/risk/i_reconciler.hpp"
#include "optrisk/risk/i_underlying_state_provider.hpp"
#include "optrisk/risk/in_memory_position_record.hpp"
#include "optrisk/risk/ltp_cache.hpp"
#include "optrisk/risk/position_store.hpp"
#include "optrisk/risk/trailing_engine.hpp"
#include "optrisk/risk/underlying_state_store.hpp"
#include "optrisk/rules/rule_engine.hpp"
#include "optrisk/time/i_time_provider.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Orchestrator that owns every risk component, thread and socket, and
//         exposes the engine's public surface: addPosition, onTick,
//         positionSnapshot, exit notifications and IPC commands.
//
// @details
// Components are built in the constructor so a RiskManager that was never
// started is still fully usable from one thread: addPosition() / onTick() /
// sweepOnce() drive it synchronously. start() adds the threads.
//
// Thread layout after start():
//
//   market_data thread   ZMQ SUB recv → tick bus (synchronous)
//                          → PositionStore::onTick, LtpCache, UnderlyingStateStore
//   sweep thread         sweepOnce() every 500 ms (5 s when the book is empty)
//                          → RuleEngine → ExitCoordinator
//   notification loop    ExitNotificationEvent / ExitFailedEvent /
//                        PositionOpenedEvent subscribers (logging, telemetry)
//   ipc thread           REP commands, PUB telemetry
//   main thread          start(), wait, stop()
//
// Sweep pass:
//   The book is copied with PositionStore::allOpen(). Each position is
//   evaluated on that copy and, on Exit, handed to ExitCoordinator. A
//   std::exception while handling one position is logged and the pass moves
//   on to the next position.
//
// Ownership:
//   RiskManager
//    ├── config_              (EngineConfig, by value)
//    ├── clock_               (ITimeProvider&, borrowed)
//    ├── id_gen_              (PositionIdGenerator)
//    ├── tick_bus_            (EventBus, synchronous tick fan-out)
//    ├── notification_loop_   (EventLoopThread)
//    ├── store_, ltp_cache_, underlying_store_, records_
//    ├── paper_router_        (only when no router is injected)
//    ├── trailing_, rule_engine_, coordinator_
//    ├── sweep_               (SweepThread)
//    ├── ipc_server_          (created in start() if endpoints are set)
//    └── market_data_thread_  (created in start() if the endpoint is set)
//
// Member order is destruction order in reverse: threads go first, then the
// components they call, then the buses the components subscribe to.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config      Validated engine configuration.
  // @param  clock       Engine clock. In ClockMode::Simulation it must be a
  //                     SimulationTimeProvider; the gateway advances it.
  // @param  router      Exit order router. nullptr → internal
  //                     PaperOrderRouter filling at the LTP.
  // @param  underlying  Underlying snapshot source. nullptr → internal
  //                     UnderlyingStateStore fed by the tick bus.
  //
  // Borrowed pointers and the clock must outlive the RiskManager.
  // -------------------------------------------------------------------------
  RiskManager(config::EngineConfig config, ITimeProvider& clock,
              IOrderRouter* router = nullptr,
              const IUnderlyingStateProvider* underlying = nullptr);

  ~RiskManager();

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;
  RiskManager(RiskManager&&) = delete;
  RiskManager& operator=(RiskManager&&) = delete;

  // -------------------------------------------------------------------------
  // start(reconciler)
  // -------------------------------------------------------------------------
  // @brief  Hydrates positions from the reconciler (if any), then starts the
  //         notification loop, IPC server, sweep thread and market data
  //         thread in that order. No-op if already running.
  //
  // @details
  // Hydration runs on the calling thread before any worker exists. An entry
  // the store rejects is logged and skipped.
  // -------------------------------------------------------------------------
  void start(IReconciler* reconciler = nullptr);

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Stops tick inflow first, then IPC, then the sweep, then drains
  //         and stops the notification loop. Components stay alive until
  //         destruction so state can still be inspected. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // addPosition(request)
  // -------------------------------------------------------------------------
  // @brief  Registers a confirmed fill and returns its PositionId.
  //
  // @details
  // A request with neither sl_price nor sl_pct gets hard_limits.sl_pct; the
  // same for the take-profit side. Publishes PositionOpenedEvent and wakes
  // the sweep.
  //
  // @throws std::invalid_argument on an incomplete instrument key, a
  //         non-positive entry price or quantity, or a negative percent.
  // -------------------------------------------------------------------------
  domain::PositionId addPosition(domain::PositionRequest request);

  // Publishes on the tick bus on the caller's thread.
  void onTick(const TickEvent& tick);
  void onUnderlyingState(const domain::UnderlyingState& state);

  std::optional<domain::Position> positionSnapshot(domain::PositionId id) const;

  // -------------------------------------------------------------------------
  // sweepOnce()
  // -------------------------------------------------------------------------
  // @brief  One full evaluation pass over the book.
  // @return Number of positions still open afterwards.
  //
  // Thread-safety: Safe to call concurrently with the sweep thread; the
  //                coordinator guarantees each position exits at most once.
  // -------------------------------------------------------------------------
  std::size_t sweepOnce();

  // Manual exit through the coordinator.
  ExitResult exitPosition(domain::PositionId id,
                          const std::string& reason = "manual_exit");

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  IPC command handler. Always returns a JSON object with "status"
  //         "ok" or "error".
  //
  //   PING             → {"response":"PONG"}
  //   STATUS           → open positions with pnl_pct, peak and sl_offset
  //   SNAPSHOT <id>    → one position
  //   EXIT <id>        → manual exit, reason "manual_exit"
  //   ADD <json>       → register a fill, returns its id
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Subscribers run on the notification loop thread.
  EventBus& notificationBus() { return notification_loop_.eventBus(); }

  EventBus& tickBus() { return tick_bus_; }

  const PositionStore& store() const { return *store_; }
  const InMemoryPositionRecordRepository& records() const { return *records_; }
  const ExitCoordinator& coordinator() const { return *coordinator_; }
  const config::EngineConfig& config() const { return config_; }

  bool running() const { return running_; }

 private:
  void hydrate(IReconciler& reconciler);
  void applyDefaults(domain::PositionRequest& request) const;
  void publishNotification(Event event);

  std::string statusJson() const;

  config::EngineConfig config_;
  ITimeProvider& clock_;

  PositionIdGenerator id_gen_;

  EventBus tick_bus_;
  EventLoopThread notification_loop_{"NotificationLoop"};

  std::unique_ptr<PositionStore> store_;
  std::unique_ptr<LtpCache> ltp_cache_;
  std::unique_ptr<UnderlyingStateStore> underlying_store_;
  const IUnderlyingStateProvider* underlying_{nullptr};
  std::unique_ptr<InMemoryPositionRecordRepository> records_;

  std::unique_ptr<PaperOrderRouter> paper_router_;
  IOrderRouter* router_{nullptr};

  std::unique_ptr<TrailingEngine> trailing_;
  std::unique_ptr<RuleEngine> rule_engine_;
  std::unique_ptr<ExitCoordinator> coordinator_;

  std::unique_ptr<SweepThread> sweep_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  std::vector<EventBus::SubscriptionId> telemetry_subs_;
  bool running_{false};
};

}  // namespace optrisk
