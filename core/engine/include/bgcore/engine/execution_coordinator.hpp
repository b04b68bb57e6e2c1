#pragma once

#include "bgcore/concurrent/event_loop_thread.hpp"
#include "bgcore/concurrent/order_id_generator.hpp"
#include "bgcore/domain/order.hpp"
#include "bgcore/domain/order_intent.hpp"
#include "bgcore/eventbus/event_bus.hpp"
#include "bgcore/events/event.hpp"
#include "bgcore/exchange/i_exchange_transport.hpp"
#include "bgcore/ledger/ledger_store.hpp"
#include "bgcore/ledger/order_ledger.hpp"
#include "bgcore/marketdata/market_data_cache.hpp"
#include "bgcore/risk/risk_gate.hpp"
#include "bgcore/session/exchange_session.hpp"
#include "bgcore/strategy/i_strategy.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace bgcore {

struct CoordinatorConfig {
  std::vector<std::string> symbols;
  std::int64_t decision_interval_ms{1000};  // 0 disables the timer thread
  std::int64_t pending_timeout_ms{10000};
  // Working limit orders older than this are cancelled, 0 = never.
  std::int64_t order_ttl_ms{0};
  std::int64_t shutdown_grace_ms{3000};
  std::int64_t save_interval_ms{60000};     // Periodic snapshot, 0 = never
  std::size_t stream_queue_capacity{4096};
  bool resync_on_start{true};
  // Start client ids above now_ms * 1000 so clientOids never repeat across
  // restarts without a persisted snapshot.
  bool seed_ids_from_clock{false};
};

struct CoordinatorStats {
  std::uint64_t decisions{0};
  std::uint64_t intents{0};
  std::uint64_t risk_rejections{0};
  std::uint64_t submissions{0};
  std::uint64_t submit_failures{0};
  std::uint64_t resyncs{0};
  std::uint64_t cancels{0};
};

// -----------------------------------------------------------------------------
// ExecutionCoordinator
// -----------------------------------------------------------------------------
//
// @brief  Wires transport, cache, ledger, risk gate and strategy together
//         and drives them from two event loops and a timer.
//
// @details
// Threads:
//
//   stream loop (bounded EventLoopThread)
//     Receives every event the transport emits plus the acks, rejects,
//     snapshots and reconcile events the coordinator produces. Each event
//     is applied to the MarketDataCache, then to the OrderLedger, in
//     delivery order. A full queue blocks the transport's reader.
//
//   decision loop (unbounded EventLoopThread)
//     DecisionTickEvent → strategy → normalize → RiskGate → register in the
//     ledger → submit. StreamStatusEvent{ResyncRequired} → resync: fetch
//     open orders, query reconciliation candidates, fetch books and
//     balances, then push the results into the stream loop. Ticks are
//     coalesced so a burst of book updates costs one decision pass.
//
//     CancelRequestEvent → transport cancel. The Cancelled state is applied
//     when the exchange's CancelAckEvent comes back through the stream loop.
//
//   timer thread
//     Schedules a decision tick every decision_interval_ms, sweeps Pending
//     orders older than pending_timeout_ms into a resync, cancels working
//     limit orders older than order_ttl_ms, retries an incomplete resync
//     and saves the ledger snapshot periodically.
//
// Failure handling:
//   - AuthError from any exchange call, a stream AuthFailed status and a
//     drawdown violation halt the session. New submissions stop for the
//     rest of the run; the reason is logged and published.
//   - ExchangeRejection on submit → RejectEvent for that order only.
//   - RateLimitExceeded on submit → the order was never sent → RejectEvent.
//   - Other TransientNetworkError on submit → outcome unknown, the order
//     stays Pending and a resync settles it by clientOid.
//   - A refused or failed cancel leaves the order as it is and runs a
//     resync; an order the exchange already finished settles there.
//
// Shutdown (stop()):
//   stop the timer and the decision loop, drain the stream loop for the
//   grace period, give every still-Pending order one reconciliation
//   attempt, stop the stream and save the ledger snapshot.
//
// Ownership:
//   Holds references only. The coordinator owns no business state; all of
//   it lives in the ledger, the cache and the session.
// -----------------------------------------------------------------------------
class ExecutionCoordinator {
 public:
  ExecutionCoordinator(ExchangeSession& session, IExchangeTransport& transport,
                       MarketDataCache& cache, OrderLedger& ledger,
                       RiskGate& risk, const IStrategy& strategy,
                       CoordinatorConfig config,
                       ILedgerStore* store = nullptr,
                       EventBus* telemetry = nullptr);
  ~ExecutionCoordinator();

  ExecutionCoordinator(const ExecutionCoordinator&) = delete;
  ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Runs the strategy for one symbol (all symbols when empty) on the
  // decision loop.
  void requestDecision(const std::string& symbol = {});

  // Full resync when symbol is empty, otherwise orders, balances and that
  // symbol's book.
  void requestResync(const std::string& symbol, const std::string& reason);

  // Queues a cancel of one open order on the decision loop. Returns false
  // if the order is unknown or already terminal.
  bool requestCancel(domain::OrderId client_id, const std::string& reason);

  // Queues a cancel of every open order. Returns how many were queued.
  std::size_t requestCancelAll(const std::string& reason);

  // Feeds an event into the stream loop as if the transport emitted it.
  void injectEvent(Event event);

  // Halts the session. Returns false if it was already halted.
  bool halt(const std::string& reason);

  // Waits until both loops are idle. Returns false on timeout.
  bool waitIdle(std::chrono::milliseconds timeout);

  CoordinatorStats stats() const;

 private:
  void onStreamEvent(const Event& event);
  void onDecisionEvent(const Event& event);

  void runDecision(const std::string& symbol);
  void processIntent(const domain::OrderIntent& intent);
  std::optional<domain::OrderIntent> normalize(
      const domain::OrderIntent& intent) const;
  void submit(const domain::Order& order);
  void performCancel(domain::OrderId client_id, const std::string& reason);

  void performResync(const std::string& symbol);
  // Fetches open orders and queries every reconciliation candidate.
  ReconcileEvent collectOrderState();
  void reconcilePendingOnShutdown();

  void timerLoop();
  void sweepPending();
  void sweepExpired();
  void saveSnapshot();
  void checkDrawdown();
  void onStreamStatus(const StreamStatusEvent& status);
  void emitTelemetry(const Event& event);
  std::int64_t nowMs() const { return session_.clock().now_ms(); }

  ExchangeSession& session_;
  IExchangeTransport& transport_;
  MarketDataCache& cache_;
  OrderLedger& ledger_;
  RiskGate& risk_;
  const IStrategy& strategy_;
  const CoordinatorConfig config_;
  ILedgerStore* store_;
  EventBus* telemetry_;

  OrderIdGenerator ids_;
  EventLoopThread stream_loop_;
  EventLoopThread decision_loop_;

  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};  // Decisions allowed
  std::atomic<bool> resync_retry_{false};

  // Coalescing: a symbol already queued is not queued again. "" = all.
  std::mutex tick_mutex_;
  std::set<std::string> pending_ticks_;
  std::mutex resync_mutex_;
  std::set<std::string> pending_resyncs_;
  // Orders with a cancel queued or sent. Pruned once they are terminal.
  std::mutex cancel_mutex_;
  std::set<domain::OrderId> cancel_requested_;

  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  std::thread timer_thread_;

  std::atomic<std::uint64_t> decisions_{0};
  std::atomic<std::uint64_t> intents_{0};
  std::atomic<std::uint64_t> risk_rejections_{0};
  std::atomic<std::uint64_t> submissions_{0};
  std::atomic<std::uint64_t> submit_failures_{0};
  std::atomic<std::uint64_t> resyncs_{0};
  std::atomic<std::uint64_t> cancels_{0};
};

}  // namespace bgcore
