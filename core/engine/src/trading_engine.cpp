#include "bgcore/engine/trading_engine.hpp"

#include "bgcore/domain/domain_json.hpp"
#include "bgcore/domain/errors.hpp"
#include "bgcore/strategy/strategy_factory.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

namespace bgcore {

namespace {

std::size_t cacheDepth(int book_depth) {
  return book_depth > 0 ? static_cast<std::size_t>(book_depth) : 50;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
// Builds the session, transports, cache, ledger and store. Nothing connects
// and no thread starts until start().
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(EngineConfig config, const ITimeProvider& clock,
                             TransportFactory transport_factory)
    : config_(std::move(config)), clock_(clock) {
  session_ = std::make_unique<ExchangeSession>(
      config_.credentials, config_.exchange.product_type,
      config_.exchange.margin_coin, clock_);
  session_->setInstruments(config_.instruments);

  if (transport_factory) {
    transport_ = transport_factory(*session_);
  } else if (config_.exchange.mode == TradingMode::Live) {
    transport_ =
        std::make_unique<BitgetTransport>(*session_, config_.transportConfig());
  } else {
    public_session_ = std::make_unique<ExchangeSession>(
        Credentials{}, config_.exchange.product_type,
        config_.exchange.margin_coin, clock_);
    public_session_->setInstruments(config_.instruments);
    market_data_ = std::make_unique<BitgetTransport>(*public_session_,
                                                     config_.transportConfig());
    transport_ = std::make_unique<SimulatedTransport>(*session_, config_.paper,
                                                      market_data_.get());
  }
  if (!transport_) {
    throw ConfigError("transport factory returned no transport");
  }

  cache_ = std::make_unique<MarketDataCache>(
      *session_, cacheDepth(config_.exchange.book_depth));
  ledger_ = std::make_unique<OrderLedger>(*session_, &telemetry_bus_);
  if (!config_.persistence.snapshot_path.empty()) {
    store_ =
        std::make_unique<JsonFileLedgerStore>(config_.persistence.snapshot_path);
  }
}

TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Clock offset (signed requests are refused on a skewed clock) ----
  if (auto* bitget = dynamic_cast<BitgetTransport*>(transport_.get())) {
    if (session_->credentials().complete()) {
      bitget->syncClock();
    }
  }

  // ---  2) Instrument metadata ---------------------------------------------
  loadInstruments();

  // ---  3) Warm start from the persisted ledger -----------------------------
  if (!coordinator_) {
    warmStart();
  }

  // ---  4) Decision components ----------------------------------------------
  if (!coordinator_) {
    strategy_ = makeStrategy(config_.strategy.name,
                             config_.strategy.book_imbalance,
                             session_->instruments());
    risk_ = std::make_unique<RiskGate>(config_.risk, clock_);

    CoordinatorConfig cc;
    cc.symbols = config_.symbols();
    cc.decision_interval_ms = config_.engine.decision_interval_ms;
    cc.pending_timeout_ms = config_.engine.pending_timeout_ms;
    cc.order_ttl_ms = config_.engine.order_ttl_ms;
    cc.shutdown_grace_ms = config_.engine.shutdown_grace_ms;
    cc.stream_queue_capacity = config_.engine.stream_queue_capacity;
    cc.save_interval_ms = store_ ? config_.persistence.save_interval_ms : 0;
    // Without a snapshot the next id cannot be known; stay clear of every
    // id an earlier run could have used.
    cc.seed_ids_from_clock = config_.exchange.mode == TradingMode::Live &&
                             ledger_->maxOrderId() == 0;

    coordinator_ = std::make_unique<ExecutionCoordinator>(
        *session_, *transport_, *cache_, *ledger_, *risk_, *strategy_,
        std::move(cc), store_.get(), &telemetry_bus_);
  }

  // ---  5) IpcServer, then the coordinator ----------------------------------
  if (config_.ipc.enabled && !ipc_server_) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.cmd_endpoint, config_.ipc.pub_endpoint);
    ipc_server_->start();
    telemetry_subscriptions_.push_back(telemetry_bus_.subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); }));
  }

  coordinator_->start();
  running_ = true;

  std::cout << "[TradingEngine] started. mode=" << toString(config_.exchange.mode)
            << " strategy=" << strategy_->id()
            << " instruments=" << session_->instruments().size()
            << (ipc_server_ ? " ipc=on" : " ipc=off") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Coordinator: stop decisions, drain, reconcile, save --------------
  coordinator_->stop();

  // ---  2) IpcServer last so shutdown telemetry still goes out ---------------
  for (auto id : telemetry_subscriptions_) {
    telemetry_bus_.unsubscribe(id);
  }
  telemetry_subscriptions_.clear();
  if (ipc_server_) {
    ipc_server_->stop();
    ipc_server_.reset();
  }

  running_ = false;
  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// loadInstruments()
// -----------------------------------------------------------------------------
// Exchange metadata replaces the configured precision for every configured
// symbol. A symbol the exchange does not list is a configuration error. If
// the contract list cannot be fetched the configured values are kept.
// -----------------------------------------------------------------------------
void TradingEngine::loadInstruments() {
  if (!config_.exchange.load_instruments) {
    return;
  }
  const auto symbols = config_.symbols();

  std::vector<domain::Instrument> listed;
  try {
    listed = transport_->fetchInstruments();
  } catch (const TransientNetworkError& e) {
    std::cerr << "[TradingEngine] WARNING: could not load contracts ("
              << e.what() << "), using configured instrument metadata\n";
    return;
  }

  for (const auto& symbol : symbols) {
    auto it = std::find_if(listed.begin(), listed.end(),
                           [&](const domain::Instrument& i) {
                             return i.symbol == symbol;
                           });
    if (it == listed.end()) {
      throw ConfigError("instrument " + symbol + " is not listed for " +
                        config_.exchange.product_type);
    }
    session_->addInstrument(*it);
    if (public_session_) {
      public_session_->addInstrument(*it);
    }
    std::cout << "[TradingEngine] Instrument " << it->symbol
              << ": price_precision=" << it->price_precision
              << " quantity_precision=" << it->quantity_precision
              << " min_quantity=" << it->min_quantity << "\n";
  }
}

void TradingEngine::warmStart() {
  if (!store_) {
    return;
  }
  auto snapshot = store_->load();
  if (!snapshot) {
    std::cout << "[TradingEngine] No ledger snapshot, cold start.\n";
    return;
  }
  ledger_->hydrate(*snapshot);
  std::cout << "[TradingEngine] Warm start: " << snapshot->open_orders.size()
            << " open order(s), " << snapshot->positions.size()
            << " position(s) hydrated, last_sequence="
            << snapshot->last_sequence << ".\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  const std::string command = IpcServer::normalizeCommand(cmd);
  nlohmann::json response;

  if (command == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (command == "STATUS") {
    const LedgerView view = ledger_->view();
    response["status"] = "ok";
    response["halted"] = session_->halted();
    response["halt_reason"] = session_->haltReason();
    response["mode"] = toString(config_.exchange.mode);
    response["running"] = running_.load();

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& [symbol, position] : view.positions) {
      positions.push_back(nlohmann::json(position));
    }
    response["positions"] = std::move(positions);

    nlohmann::json balances = nlohmann::json::array();
    for (const auto& [asset, balance] : view.balances) {
      balances.push_back(nlohmann::json(balance));
    }
    response["balances"] = std::move(balances);

    nlohmann::json orders = nlohmann::json::array();
    for (const auto& order : view.open_orders) {
      orders.push_back(nlohmann::json(order));
    }
    response["open_orders"] = std::move(orders);
    response["realized_pnl"] = view.realized_pnl;
  } else if (command == "HALT") {
    if (coordinator_) {
      coordinator_->halt("operator HALT");
    } else {
      session_->halt("operator HALT");
    }
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (command.rfind("CANCEL ", 0) == 0) {
    const std::string target = command.substr(7);
    if (!coordinator_ || !running_) {
      response["status"] = "error";
      response["response"] = "Engine not running";
    } else if (target == "ALL") {
      const std::size_t queued = coordinator_->requestCancelAll("operator CANCEL ALL");
      response["status"] = "ok";
      response["response"] = "Cancel requested for " + std::to_string(queued) + " order(s)";
    } else {
      domain::OrderId id = 0;
      const auto* first = target.data();
      const auto* last = target.data() + target.size();
      const auto [ptr, ec] = std::from_chars(first, last, id);
      if (ec != std::errc{} || ptr != last || target.empty()) {
        response["status"] = "error";
        response["response"] = "Invalid order id: " + target;
      } else if (coordinator_->requestCancel(id, "operator CANCEL")) {
        response["status"] = "ok";
        response["response"] = "Cancel requested for order " + target;
      } else {
        response["status"] = "error";
        response["response"] = "No open order " + target;
      }
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + command;
  }

  return response.dump();
}

}  // namespace bgcore
