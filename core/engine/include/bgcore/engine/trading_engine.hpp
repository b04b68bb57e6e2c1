#pragma once

#include "bgcore/engine/engine_config.hpp"
#include "bgcore/engine/execution_coordinator.hpp"
#include "bgcore/eventbus/event_bus.hpp"
#include "bgcore/exchange/bitget_transport.hpp"
#include "bgcore/exchange/i_exchange_transport.hpp"
#include "bgcore/exchange/simulated_transport.hpp"
#include "bgcore/ledger/ledger_store.hpp"
#include "bgcore/ledger/order_ledger.hpp"
#include "bgcore/marketdata/market_data_cache.hpp"
#include "bgcore/network/ipc_server.hpp"
#include "bgcore/risk/risk_gate.hpp"
#include "bgcore/session/exchange_session.hpp"
#include "bgcore/strategy/i_strategy.hpp"
#include "bgcore/time/i_time_provider.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace bgcore {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the process: builds every component from an
//         EngineConfig, owns them, and exposes start/stop plus the operator
//         command handler.
//
// @details
// Component graph:
//
//   ExchangeSession ──┬── transport (BitgetTransport, or SimulatedTransport
//                     │              over a public-only BitgetTransport)
//                     ├── MarketDataCache
//                     ├── OrderLedger ──── telemetry EventBus ── IpcServer
//                     └── ExecutionCoordinator (cache, ledger, RiskGate,
//                                               strategy, ILedgerStore)
//
// Startup sequence (start()):
//   1. Live mode: measure the clock offset against the exchange.
//   2. Load instrument metadata for the configured symbols.
//   3. Warm start: hydrate the ledger from the persisted snapshot.
//   4. Build strategy, risk gate and coordinator.
//   5. Start the IpcServer, then the coordinator (stream + startup resync).
//
// Shutdown (stop()):
//   coordinator first (drains, reconciles, saves), then the IpcServer so
//   the final telemetry is published.
//
// Thread model:
//   Constructed, started and stopped from one thread (main). executeCommand
//   runs on the IpcServer thread and only touches thread-safe accessors.
//
// Ownership:
//   Everything is held by unique_ptr so construction order can follow the
//   references between components and destruction runs in reverse.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  // Builds the order-entry transport. Tests use it to inject a
  // SimulatedTransport with failure injection.
  using TransportFactory =
      std::function<std::unique_ptr<IExchangeTransport>(ExchangeSession&)>;

  TradingEngine(EngineConfig config, const ITimeProvider& clock,
                TransportFactory transport_factory = nullptr);

  // Destructor calls stop() for RAII safety.
  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // Throws AuthError / ConfigError / TransientNetworkError when the
  // startup steps fail. Idempotent while running.
  void start();

  // Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one operator command and returns a JSON response.
  //
  // @details
  //   "PING"   → {"status":"ok","response":"PONG"}
  //   "STATUS" → {"status":"ok","halted":bool,"halt_reason":"...",
  //               "mode":"...","positions":[...],"balances":[...],
  //               "open_orders":[...],"realized_pnl":x}
  //   "HALT"   → {"status":"ok","response":"Trading halted"}
  //   other    → {"status":"error","response":"Unknown command: ..."}
  //
  // Commands are trimmed and case-insensitive.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Ledger updates, risk rejections, stream status and halts.
  EventBus& telemetryBus() { return telemetry_bus_; }

  ExchangeSession& session() { return *session_; }
  const OrderLedger& ledger() const { return *ledger_; }
  const MarketDataCache& cache() const { return *cache_; }
  IExchangeTransport& transport() { return *transport_; }

  // Null until start().
  ExecutionCoordinator* coordinator() { return coordinator_.get(); }

 private:
  void loadInstruments();
  void warmStart();

  const EngineConfig config_;
  const ITimeProvider& clock_;

  EventBus telemetry_bus_;
  std::vector<EventBus::SubscriptionId> telemetry_subscriptions_;

  std::unique_ptr<ExchangeSession> session_;
  // Paper mode: credential-less session for the public market data stream.
  std::unique_ptr<ExchangeSession> public_session_;
  std::unique_ptr<IExchangeTransport> market_data_;
  std::unique_ptr<IExchangeTransport> transport_;

  std::unique_ptr<MarketDataCache> cache_;
  std::unique_ptr<OrderLedger> ledger_;
  std::unique_ptr<ILedgerStore> store_;
  std::unique_ptr<RiskGate> risk_;
  std::unique_ptr<IStrategy> strategy_;
  std::unique_ptr<ExecutionCoordinator> coordinator_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::atomic<bool> running_{false};
};

}  // namespace bgcore
