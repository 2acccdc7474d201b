#include "optrisk/engine/risk_manager.hpp"
#include "optrisk/domain/position_json.hpp"
#include "optrisk/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace optrisk {

namespace {

void requireNonNegative(const std::optional<double>& value, const char* name) {
  if (value && (*value < 0.0 || !std::isfinite(*value))) {
    throw std::invalid_argument(std::string(name) +
                                " must be a non-negative number");
  }
}

std::string errorReply(const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["message"] = message;
  return j.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build every component; no threads yet
// -----------------------------------------------------------------------------
RiskManager::RiskManager(config::EngineConfig config, ITimeProvider& clock,
                         IOrderRouter* router,
                         const IUnderlyingStateProvider* underlying)
    : config_(std::move(config)), clock_(clock) {
  store_ = std::make_unique<PositionStore>(tick_bus_, clock_);
  ltp_cache_ = std::make_unique<LtpCache>(tick_bus_);
  underlying_store_ = std::make_unique<UnderlyingStateStore>(
      tick_bus_, clock_, config_.underlying_exit.max_staleness_ms);
  underlying_ = underlying != nullptr ? underlying : underlying_store_.get();
  records_ = std::make_unique<InMemoryPositionRecordRepository>();

  if (router != nullptr) {
    router_ = router;
  } else {
    paper_router_ = std::make_unique<PaperOrderRouter>();
    router_ = paper_router_.get();
  }

  trailing_ = std::make_unique<TrailingEngine>(
      *store_, config_.trailing, config_.reverse_loss,
      DrawdownSchedule(config_.drawdown, config_.reverse_loss));
  rule_engine_ = std::make_unique<RuleEngine>(
      buildDefaultRuleChain(config_, *trailing_));
  coordinator_ = std::make_unique<ExitCoordinator>(
      *store_, *records_, *ltp_cache_, *router_, clock_,
      [this](Event event) { publishNotification(std::move(event)); });

  sweep_ = std::make_unique<SweepThread>(
      [this] { return sweepOnce(); },
      std::chrono::milliseconds(config_.sweep.busy_interval_ms),
      std::chrono::milliseconds(config_.sweep.idle_interval_ms));

  store_->setRemovalCallback([this](domain::PositionId) {
    if (sweep_) {
      sweep_->wake();
    }
  });
}

RiskManager::~RiskManager() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void RiskManager::start(IReconciler* reconciler) {
  if (running_) {
    return;
  }

  // ---  1) Hydrate before any thread can touch the store -------------------
  if (reconciler != nullptr) {
    hydrate(*reconciler);
  }

  // ---  2) Notification loop ------------------------------------------------
  notification_loop_.start();

  // ---  3) IPC server + telemetry bridges -----------------------------------
  const auto& net = config_.network;
  if (!net.ipc_cmd_endpoint.empty() && !net.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        net.ipc_cmd_endpoint, net.ipc_pub_endpoint);
    ipc_server_->start();

    auto& bus = notification_loop_.eventBus();
    telemetry_subs_.push_back(bus.subscribe<PositionOpenedEvent>(
        [this](const PositionOpenedEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
    telemetry_subs_.push_back(bus.subscribe<ExitNotificationEvent>(
        [this](const ExitNotificationEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
    telemetry_subs_.push_back(bus.subscribe<ExitFailedEvent>(
        [this](const ExitFailedEvent& e) { ipc_server_->pushTelemetry(e); }));
  }

  // ---  4) Sweep ------------------------------------------------------------
  sweep_->start();

  // ---  5) Market data LAST (ticks begin flowing) ---------------------------
  if (!net.market_data_endpoint.empty()) {
    SimulationTimeProvider* sim_clock = nullptr;
    if (config_.clock == config::ClockMode::Simulation) {
      sim_clock = dynamic_cast<SimulationTimeProvider*>(&clock_);
      if (sim_clock == nullptr) {
        std::cerr << "[RiskManager] Simulation clock mode configured but the "
                     "clock is not a SimulationTimeProvider; feed timestamps "
                     "will not advance it.\n";
      }
    }
    market_data_thread_ = std::make_unique<MarketDataThread>(
        sim_clock,
        [this](Event event) {
          if (const auto* tick = std::get_if<TickEvent>(&event)) {
            onTick(*tick);
          } else if (const auto* state =
                         std::get_if<UnderlyingStateEvent>(&event)) {
            onUnderlyingState(state->state);
          }
        },
        net.market_data_endpoint);
    market_data_thread_->start();
  }

  running_ = true;

  std::cout << "[RiskManager] started. " << store_->size()
            << " open position(s). Threads: notification, sweep"
            << (ipc_server_ ? ", ipc" : "")
            << (market_data_thread_ ? ", market_data" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void RiskManager::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop tick inflow -------------------------------------------------
  market_data_thread_.reset();

  // ---  2) Stop IPC (executeCommand touches every component) ----------------
  for (auto id : telemetry_subs_) {
    notification_loop_.eventBus().unsubscribe(id);
  }
  telemetry_subs_.clear();
  ipc_server_.reset();

  // ---  3) Stop the sweep ---------------------------------------------------
  sweep_->stop();

  // ---  4) Deliver what is queued and stop the notification loop -----------
  notification_loop_.stop();

  // ---  5) End of session: closed records are no longer needed ------------
  std::size_t purged = records_->purgeClosed();

  running_ = false;

  std::cout << "[RiskManager] stopped. " << coordinator_->exitsExecuted()
            << " exit(s) executed, " << store_->size()
            << " position(s) still open, " << purged
            << " closed record(s) released.\n";
}

// -----------------------------------------------------------------------------
// hydrate(): restore positions from a previous session
// -----------------------------------------------------------------------------
void RiskManager::hydrate(IReconciler& reconciler) {
  auto positions = reconciler.reconcilePositions();
  std::size_t restored = 0;

  for (auto& pos : positions) {
    try {
      store_->hydrate(pos);
      records_->create(pos.id);
      id_gen_.observe(pos.id);
      ++restored;

      auto snapshot = store_->snapshot(pos.id);
      if (snapshot) {
        PositionOpenedEvent opened;
        opened.position = *snapshot;
        opened.hydrated = true;
        publishNotification(std::move(opened));
      }
    } catch (const std::invalid_argument& e) {
      std::cerr << "[RiskManager] Skipping hydrated position " << pos.id
                << ": " << e.what() << "\n";
    }
  }

  std::cout << "[RiskManager] Reconciliation complete: " << restored << " of "
            << positions.size() << " position(s) hydrated.\n";
}

// -----------------------------------------------------------------------------
// addPosition()
// -----------------------------------------------------------------------------
domain::PositionId RiskManager::addPosition(domain::PositionRequest request) {
  if (!request.instrument.valid()) {
    throw std::invalid_argument("position needs a segment and a security_id");
  }
  if (!(request.entry_price > 0.0) || !std::isfinite(request.entry_price)) {
    throw std::invalid_argument("entry_price must be positive");
  }
  if (!(request.quantity > 0.0) || !std::isfinite(request.quantity)) {
    throw std::invalid_argument("quantity must be positive");
  }
  const auto& t = request.thresholds;
  requireNonNegative(t.sl_pct, "sl_pct");
  requireNonNegative(t.tp_pct, "tp_pct");
  requireNonNegative(t.sl_price, "sl_price");
  requireNonNegative(t.tp_price, "tp_price");
  requireNonNegative(t.max_loss_rupees, "max_loss_rupees");
  requireNonNegative(t.target_profit_rupees, "target_profit_rupees");

  applyDefaults(request);

  domain::Position pos;
  pos.id = id_gen_.next_id();
  pos.instrument = std::move(request.instrument);
  pos.index_key = std::move(request.index_key);
  pos.side = request.side;
  pos.direction = request.direction;
  pos.entry_price = request.entry_price;
  pos.quantity = request.quantity;
  pos.thresholds = request.thresholds;
  pos.underlying = std::move(request.underlying);
  pos.opened_at_ms = clock_.now_ms();

  // Record first: a sweep must never see a store entry without its record.
  records_->create(pos.id);
  store_->add(pos);

  std::cout << "[RiskManager] Added position " << pos.id << " "
            << pos.instrument.composite() << " entry=" << pos.entry_price
            << " qty=" << pos.quantity << "\n";

  auto snapshot = store_->snapshot(pos.id);
  if (snapshot) {
    PositionOpenedEvent opened;
    opened.position = *snapshot;
    publishNotification(std::move(opened));
  }

  sweep_->wake();
  return pos.id;
}

void RiskManager::applyDefaults(domain::PositionRequest& request) const {
  auto& t = request.thresholds;
  if (!t.sl_price && !t.sl_pct && config_.hard_limits.default_sl_pct > 0.0) {
    t.sl_pct = config_.hard_limits.default_sl_pct;
  }
  if (!t.tp_price && !t.tp_pct && config_.hard_limits.default_tp_pct > 0.0) {
    t.tp_pct = config_.hard_limits.default_tp_pct;
  }
}

void RiskManager::onTick(const TickEvent& tick) { tick_bus_.publish(tick); }

void RiskManager::onUnderlyingState(const domain::UnderlyingState& state) {
  tick_bus_.publish(UnderlyingStateEvent{state});
}

std::optional<domain::Position> RiskManager::positionSnapshot(
    domain::PositionId id) const {
  return store_->snapshot(id);
}

// -----------------------------------------------------------------------------
// sweepOnce(): evaluate the pass-start copy, exit what the rules ask for
// -----------------------------------------------------------------------------
std::size_t RiskManager::sweepOnce() {
  auto positions = store_->allOpen();

  RuleContext context;
  context.now_ms = clock_.now_ms();
  context.underlying = underlying_;

  for (const auto& pos : positions) {
    try {
      Decision decision = rule_engine_->evaluate(pos, context);
      if (!decision.isExit()) {
        continue;
      }

      std::cout << "[RiskManager] Exit signal for position " << pos.id
                << " from " << decision.rule << ": " << decision.reason
                << "\n";
      coordinator_->executeExit(pos.id, decision.reason);
    } catch (const std::exception& e) {
      std::cerr << "[RiskManager] Sweep failed for position " << pos.id
                << ": " << e.what() << "\n";
    }
  }

  return store_->size();
}

ExitResult RiskManager::exitPosition(domain::PositionId id,
                                     const std::string& reason) {
  return coordinator_->executeExit(id, reason);
}

void RiskManager::publishNotification(Event event) {
  notification_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command requests
// -----------------------------------------------------------------------------
std::string RiskManager::executeCommand(const std::string& cmd) {
  auto space = cmd.find(' ');
  std::string verb = cmd.substr(0, space);
  std::string arg = space == std::string::npos ? "" : cmd.substr(space + 1);

  nlohmann::json response;

  try {
    if (verb == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (verb == "STATUS") {
      return statusJson();
    } else if (verb == "SNAPSHOT") {
      auto id = static_cast<domain::PositionId>(std::stoull(arg));
      auto snapshot = store_->snapshot(id);
      if (!snapshot) {
        return errorReply("Unknown position: " + arg);
      }
      response["status"] = "ok";
      response["position"] = domain::positionToJson(*snapshot);
    } else if (verb == "EXIT") {
      auto id = static_cast<domain::PositionId>(std::stoull(arg));
      ExitResult result = exitPosition(id, "manual_exit");
      response["status"] =
          (result.closed || result.already_closed) ? "ok" : "error";
      response["closed"] = result.closed;
      response["already_closed"] = result.already_closed;
      if (result.closed) {
        response["exit_price"] = result.exit_price;
      }
      if (!result.error.empty()) {
        response["message"] = result.error;
      }
    } else if (verb == "ADD") {
      auto request =
          domain::positionRequestFromJson(nlohmann::json::parse(arg));
      domain::PositionId id = addPosition(std::move(request));
      response["status"] = "ok";
      response["position_id"] = id;
    } else {
      return errorReply("Unknown command: " + cmd);
    }
  } catch (const nlohmann::json::exception& e) {
    return errorReply(std::string("Malformed JSON: ") + e.what());
  } catch (const std::logic_error& e) {
    // invalid_argument from validation, invalid_argument / out_of_range
    // from stoull.
    return errorReply(std::string("Bad request: ") + e.what());
  }

  return response.dump();
}

std::string RiskManager::statusJson() const {
  nlohmann::json response;
  response["status"] = "ok";

  nlohmann::json positions = nlohmann::json::array();
  for (const auto& pos : store_->allOpen()) {
    nlohmann::json p;
    p["id"] = pos.id;
    p["instrument"] = pos.instrument.composite();
    p["index_key"] = pos.index_key;
    p["status"] = domain::statusToString(pos.status);
    p["ltp"] = pos.ltp;
    p["pnl"] = pos.pnl;
    p["pnl_pct"] = pos.pnl_pct;
    p["peak_profit_pct"] = pos.peak_profit_pct;
    if (pos.sl_offset_pct) {
      p["sl_offset_pct"] = *pos.sl_offset_pct;
    } else {
      p["sl_offset_pct"] = nullptr;
    }
    positions.push_back(std::move(p));
  }
  response["open_positions"] = positions.size();
  response["positions"] = std::move(positions);
  response["exits_executed"] = coordinator_->exitsExecuted();
  response["exits_failed"] = coordinator_->exitsFailed();
  response["closed_positions"] = records_->closedRecords().size();
  response["dropped_ticks"] = store_->droppedTicks();
  return response.dump();
}

}  // namespace optrisk
