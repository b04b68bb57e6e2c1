#include "bgcore/engine/execution_coordinator.hpp"

#include "bgcore/domain/errors.hpp"

#include <iostream>
#include <iterator>
#include <limits>
#include <utility>

namespace bgcore {

namespace {

// Granularity of the timer thread.
constexpr auto kTimerSlice = std::chrono::milliseconds(100);

// How often Pending orders are checked against pending_timeout_ms.
constexpr std::int64_t kSweepIntervalMs = 1000;

// Minimum spacing between retries of an incomplete resync.
constexpr std::int64_t kResyncRetryMs = 2000;

std::int64_t steadyMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

bool isBookEvent(const Event& event) {
  return std::holds_alternative<BookSnapshotEvent>(event) ||
         std::holds_alternative<BookUpdateEvent>(event);
}

std::string bookSymbol(const Event& event) {
  if (const auto* snap = std::get_if<BookSnapshotEvent>(&event)) {
    return snap->book.symbol;
  }
  if (const auto* update = std::get_if<BookUpdateEvent>(&event)) {
    return update->symbol;
  }
  return {};
}

}  // namespace

ExecutionCoordinator::ExecutionCoordinator(
    ExchangeSession& session, IExchangeTransport& transport,
    MarketDataCache& cache, OrderLedger& ledger, RiskGate& risk,
    const IStrategy& strategy, CoordinatorConfig config, ILedgerStore* store,
    EventBus* telemetry)
    : session_(session),
      transport_(transport),
      cache_(cache),
      ledger_(ledger),
      risk_(risk),
      strategy_(strategy),
      config_(std::move(config)),
      store_(store),
      telemetry_(telemetry),
      stream_loop_("stream", config_.stream_queue_capacity),
      decision_loop_("decision") {
  stream_loop_.eventBus().subscribe(
      [this](const Event& event) { onStreamEvent(event); });
  decision_loop_.eventBus().subscribe(
      [this](const Event& event) { onDecisionEvent(event); });
  cache_.setResyncRequester(
      [this](const std::string& symbol, const std::string& reason) {
        requestResync(symbol, reason);
      });
}

ExecutionCoordinator::~ExecutionCoordinator() {
  stop();
  cache_.setResyncRequester(nullptr);
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
// Loops first so that nothing the stream delivers is lost, then the stream,
// then the startup resync, then the timer.
// -----------------------------------------------------------------------------
void ExecutionCoordinator::start() {
  if (running_.exchange(true)) {
    return;
  }

  ids_.advance_past(ledger_.maxOrderId());
  if (config_.seed_ids_from_clock) {
    ids_.advance_past(static_cast<std::uint64_t>(nowMs()) * 1000);
  }

  accepting_.store(true);
  stream_loop_.start();
  decision_loop_.start();

  transport_.startStream(
      [this](Event event) { stream_loop_.push(std::move(event)); });

  if (config_.resync_on_start) {
    requestResync("", "startup");
  }

  timer_thread_ = std::thread([this] { timerLoop(); });

  std::cout << "[ExecutionCoordinator] Started: strategy=" << strategy_.id()
            << " symbols=" << config_.symbols.size()
            << " decision_interval_ms=" << config_.decision_interval_ms
            << std::endl;
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ExecutionCoordinator::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  accepting_.store(false);

  {
    std::lock_guard lock(timer_mutex_);
  }
  timer_cv_.notify_all();
  if (timer_thread_.joinable()) {
    timer_thread_.join();
  }

  // A decision that is mid-submission finishes; queued ticks are dropped.
  decision_loop_.stop();

  const std::chrono::milliseconds grace(config_.shutdown_grace_ms);
  if (!stream_loop_.drain(grace)) {
    std::cerr << "[ExecutionCoordinator] WARNING: stream loop did not drain "
                 "within the grace period\n";
  }

  reconcilePendingOnShutdown();

  transport_.stopStream();
  stream_loop_.drain(grace);
  stream_loop_.stop();

  saveSnapshot();

  std::cout << "[ExecutionCoordinator] Stopped. open_orders="
            << ledger_.openOrderCount()
            << " realized_pnl=" << ledger_.realizedPnl() << std::endl;
}

void ExecutionCoordinator::requestDecision(const std::string& symbol) {
  {
    std::lock_guard lock(tick_mutex_);
    if (!pending_ticks_.insert(symbol).second) {
      return;
    }
  }
  DecisionTickEvent tick;
  tick.symbol = symbol;
  tick.timestamp = std::chrono::system_clock::now();
  decision_loop_.push(std::move(tick));
}

void ExecutionCoordinator::requestResync(const std::string& symbol,
                                         const std::string& reason) {
  {
    std::lock_guard lock(resync_mutex_);
    if (!pending_resyncs_.insert(symbol).second) {
      return;
    }
  }
  StreamStatusEvent request;
  request.kind = StreamStatusEvent::Kind::ResyncRequired;
  request.channel = "coordinator";
  request.symbol = symbol;
  request.reason = reason;
  request.timestamp = std::chrono::system_clock::now();
  decision_loop_.push(std::move(request));
}

bool ExecutionCoordinator::requestCancel(domain::OrderId client_id,
                                         const std::string& reason) {
  if (!running_.load()) {
    return false;
  }
  const auto order = ledger_.order(client_id);
  if (!order || domain::isTerminal(order->status)) {
    return false;
  }
  {
    std::lock_guard lock(cancel_mutex_);
    if (!cancel_requested_.insert(client_id).second) {
      return true;  // Already on its way
    }
  }
  CancelRequestEvent request;
  request.client_id = client_id;
  request.reason = reason;
  request.timestamp = std::chrono::system_clock::now();
  decision_loop_.push(std::move(request));
  return true;
}

std::size_t ExecutionCoordinator::requestCancelAll(const std::string& reason) {
  std::size_t queued = 0;
  for (const auto& order : ledger_.openOrders()) {
    if (requestCancel(order.id, reason)) {
      ++queued;
    }
  }
  return queued;
}

void ExecutionCoordinator::injectEvent(Event event) {
  stream_loop_.push(std::move(event));
}

bool ExecutionCoordinator::halt(const std::string& reason) {
  if (!session_.halt(reason)) {
    return false;
  }
  std::cerr << "[ExecutionCoordinator] TRADING HALTED: " << reason << "\n";
  RiskViolationEvent violation;
  violation.reason = reason;
  violation.current_value = ledger_.realizedPnl();
  violation.limit_value = risk_.limits().max_drawdown;
  violation.timestamp = std::chrono::system_clock::now();
  emitTelemetry(violation);
  return true;
}

bool ExecutionCoordinator::waitIdle(std::chrono::milliseconds timeout) {
  using std::chrono::milliseconds;
  const std::int64_t deadline = steadyMs() + timeout.count();
  while (true) {
    const std::int64_t remaining = deadline - steadyMs();
    if (remaining <= 0) {
      return false;
    }
    // Work moves stream → decision → stream, so both must be idle at once.
    if (stream_loop_.drain(milliseconds(remaining)) &&
        decision_loop_.drain(milliseconds(remaining)) &&
        stream_loop_.drain(milliseconds(0)) &&
        decision_loop_.drain(milliseconds(0))) {
      return true;
    }
  }
}

CoordinatorStats ExecutionCoordinator::stats() const {
  CoordinatorStats s;
  s.decisions = decisions_.load();
  s.intents = intents_.load();
  s.risk_rejections = risk_rejections_.load();
  s.submissions = submissions_.load();
  s.submit_failures = submit_failures_.load();
  s.resyncs = resyncs_.load();
  s.cancels = cancels_.load();
  return s;
}

// -----------------------------------------------------------------------------
// Stream loop
// -----------------------------------------------------------------------------
// Cache first, then ledger: a fill's mark-to-market and a strategy tick both
// see the book that arrived with it.
// -----------------------------------------------------------------------------
void ExecutionCoordinator::onStreamEvent(const Event& event) {
  if (const auto* status = std::get_if<StreamStatusEvent>(&event)) {
    onStreamStatus(*status);
    return;
  }

  const auto cache_result = cache_.applyEvent(event);
  const auto ledger_result = ledger_.applyEvent(event);

  if (isBookEvent(event) &&
      cache_result == MarketDataCache::ApplyResult::Applied) {
    requestDecision(bookSymbol(event));
  }

  if (ledger_result == OrderLedger::ApplyResult::Applied &&
      (std::holds_alternative<FillEvent>(event) ||
       std::holds_alternative<ReconcileEvent>(event))) {
    checkDrawdown();
  }

  if (const auto* reconcile = std::get_if<ReconcileEvent>(&event)) {
    if (!reconcile->complete) {
      resync_retry_.store(true);
    }
  }
}

void ExecutionCoordinator::onStreamStatus(const StreamStatusEvent& status) {
  switch (status.kind) {
    case StreamStatusEvent::Kind::Connected:
      std::cout << "[ExecutionCoordinator] Stream " << status.channel
                << " connected, resyncing" << std::endl;
      requestResync("", status.channel + " stream connected");
      break;
    case StreamStatusEvent::Kind::Disconnected:
      std::cerr << "[ExecutionCoordinator] Stream " << status.channel
                << " disconnected: " << status.reason << "\n";
      if (status.channel == "public") {
        // Books are stale until the reconnect snapshot arrives.
        for (const auto& symbol : config_.symbols) {
          cache_.invalidate(symbol, "public stream disconnected");
        }
      }
      break;
    case StreamStatusEvent::Kind::ResyncRequired:
      requestResync(status.symbol, status.reason);
      break;
    case StreamStatusEvent::Kind::AuthFailed:
      halt("stream authentication failed: " + status.reason);
      break;
  }
  emitTelemetry(status);
}

void ExecutionCoordinator::checkDrawdown() {
  auto violation = risk_.checkDrawdown(ledger_.realizedPnl());
  if (!violation) {
    return;
  }
  if (session_.halt(violation->reason)) {
    std::cerr << "[ExecutionCoordinator] TRADING HALTED: " << violation->reason
              << " (realized_pnl=" << violation->current_value
              << ", limit=" << violation->limit_value << ")\n";
    emitTelemetry(*violation);
  }
}

// -----------------------------------------------------------------------------
// Decision loop
// -----------------------------------------------------------------------------
void ExecutionCoordinator::onDecisionEvent(const Event& event) {
  if (const auto* tick = std::get_if<DecisionTickEvent>(&event)) {
    {
      std::lock_guard lock(tick_mutex_);
      pending_ticks_.erase(tick->symbol);
    }
    if (tick->symbol.empty()) {
      for (const auto& symbol : config_.symbols) {
        runDecision(symbol);
      }
    } else {
      runDecision(tick->symbol);
    }
    return;
  }

  if (const auto* cancel = std::get_if<CancelRequestEvent>(&event)) {
    performCancel(cancel->client_id, cancel->reason);
    return;
  }

  if (const auto* status = std::get_if<StreamStatusEvent>(&event)) {
    if (status->kind != StreamStatusEvent::Kind::ResyncRequired) {
      return;
    }
    {
      std::lock_guard lock(resync_mutex_);
      pending_resyncs_.erase(status->symbol);
    }
    performResync(status->symbol);
  }
}

void ExecutionCoordinator::runDecision(const std::string& symbol) {
  if (!accepting_.load() || session_.halted()) {
    return;
  }
  const MarketSnapshot market = cache_.market(symbol);
  if (!market.hasBook()) {
    return;
  }
  ++decisions_;

  const LedgerView view = ledger_.view();
  std::vector<domain::OrderIntent> intents;
  try {
    intents = strategy_.decide(market, view, view.position(symbol));
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionCoordinator] Strategy " << strategy_.id()
              << " failed on " << symbol << ": " << e.what() << "\n";
    return;
  }

  for (const auto& intent : intents) {
    if (session_.halted()) {
      break;
    }
    processIntent(intent);
  }
}

// -----------------------------------------------------------------------------
// processIntent(): normalize → risk → register → submit
// -----------------------------------------------------------------------------
void ExecutionCoordinator::processIntent(const domain::OrderIntent& intent) {
  ++intents_;

  auto normalized = normalize(intent);
  if (!normalized) {
    return;
  }

  // Fresh view: earlier intents of the same tick are already registered.
  const LedgerView view = ledger_.view();
  const RiskDecision decision =
      risk_.evaluate(*normalized, view, view.marginBalance());
  if (!decision) {
    ++risk_rejections_;
    RiskRejectEvent reject;
    reject.strategy_id = normalized->strategy_id;
    reject.symbol = normalized->symbol;
    reject.reason = decision.reason;
    reject.timestamp = std::chrono::system_clock::now();
    emitTelemetry(reject);
    return;
  }

  domain::Order order;
  order.id = ids_.next_id();
  order.strategy_id = normalized->strategy_id;
  order.symbol = normalized->symbol;
  order.side = normalized->side;
  order.type = normalized->type;
  order.price = normalized->price;
  order.quantity = normalized->quantity;
  order.reduce_only = normalized->reduce_only;
  order.status = domain::OrderStatus::Pending;
  order.created_ms = nowMs();
  order.updated_ms = order.created_ms;

  if (!ledger_.registerOrder(order)) {
    std::cerr << "[ExecutionCoordinator] WARNING: client id " << order.id
              << " already in the ledger. Skipping.\n";
    return;
  }

  std::cout << "[ExecutionCoordinator] Submitting order " << order.id << ": "
            << domain::toString(order.side) << " " << order.quantity << " "
            << order.symbol << " " << domain::toString(order.type) << " @ "
            << order.price << (order.reduce_only ? " reduce-only" : "")
            << " (" << normalized->reason << ")" << std::endl;
  submit(order);
}

std::optional<domain::OrderIntent> ExecutionCoordinator::normalize(
    const domain::OrderIntent& intent) const {
  const auto instrument = session_.instrument(intent.symbol);
  if (!instrument) {
    std::cerr << "[ExecutionCoordinator] WARNING: no instrument metadata for "
              << intent.symbol << ". Skipping.\n";
    return std::nullopt;
  }

  domain::OrderIntent out = intent;
  out.quantity = domain::roundQuantityDown(*instrument, intent.quantity);
  out.price = domain::roundPrice(*instrument, intent.price);

  if (out.quantity <= 0.0 || out.quantity < instrument->min_quantity) {
    std::cout << "[ExecutionCoordinator] Intent for " << intent.symbol
              << " below minimum quantity after rounding (" << intent.quantity
              << " -> " << out.quantity << "). Skipping." << std::endl;
    return std::nullopt;
  }
  // Closing a small position must stay possible.
  if (!out.reduce_only && out.notional() < instrument->min_notional) {
    std::cout << "[ExecutionCoordinator] Intent for " << intent.symbol
              << " below minimum notional (" << out.notional() << " < "
              << instrument->min_notional << "). Skipping." << std::endl;
    return std::nullopt;
  }
  return out;
}

// -----------------------------------------------------------------------------
// submit()
// -----------------------------------------------------------------------------
// Results go back through the stream loop so the ledger sees them in order
// with the exchange's own pushes for the same order.
// -----------------------------------------------------------------------------
void ExecutionCoordinator::submit(const domain::Order& order) {
  auto reject = [&](const std::string& code, const std::string& reason) {
    ++submit_failures_;
    RejectEvent event;
    event.client_id = order.id;
    event.symbol = order.symbol;
    event.code = code;
    event.reason = reason;
    event.timestamp = std::chrono::system_clock::now();
    stream_loop_.push(std::move(event));
  };

  try {
    const OrderAck ack = transport_.submitOrder(order);
    ++submissions_;
    OrderAckEvent event;
    event.client_id = ack.client_id != 0 ? ack.client_id : order.id;
    event.exchange_id = ack.exchange_id;
    event.symbol = order.symbol;
    event.timestamp = std::chrono::system_clock::now();
    stream_loop_.push(std::move(event));
  } catch (const AuthError& e) {
    reject("auth", e.what());
    halt(std::string("authentication failed: ") + e.what());
  } catch (const ConfigError& e) {
    reject("config", e.what());
    halt(std::string("configuration error: ") + e.what());
  } catch (const RateLimitExceeded& e) {
    std::cerr << "[ExecutionCoordinator] Order " << order.id
              << " not sent: " << e.what() << "\n";
    reject("rate-limit", e.what());
  } catch (const ExchangeRejection& e) {
    std::cerr << "[ExecutionCoordinator] Order " << order.id
              << " rejected by exchange: " << e.what() << "\n";
    reject(e.code(), e.message());
  } catch (const TransientNetworkError& e) {
    ++submit_failures_;
    std::cerr << "[ExecutionCoordinator] Order " << order.id
              << " outcome unknown (" << e.what()
              << "), left Pending for reconciliation\n";
    requestResync("", "submit outcome unknown");
  }
}

// -----------------------------------------------------------------------------
// performCancel()
// -----------------------------------------------------------------------------
// Runs on the decision loop. Cancels are allowed while halted: they only
// reduce exposure. The ledger is not touched here; the exchange's cancel
// ack (or a resync) moves the order to its terminal state.
// -----------------------------------------------------------------------------
void ExecutionCoordinator::performCancel(domain::OrderId client_id,
                                         const std::string& reason) {
  const auto order = ledger_.order(client_id);
  if (!order || domain::isTerminal(order->status)) {
    std::lock_guard lock(cancel_mutex_);
    cancel_requested_.erase(client_id);
    return;
  }

  try {
    const CancelAck ack = transport_.cancelOrder(*order);
    ++cancels_;
    std::cout << "[ExecutionCoordinator] Cancel sent for order " << client_id
              << " (" << reason << ")"
              << (ack.exchange_id.empty() ? "" : " exchange_id=" + ack.exchange_id)
              << std::endl;
  } catch (const AuthError& e) {
    halt(std::string("authentication failed: ") + e.what());
  } catch (const ConfigError& e) {
    halt(std::string("configuration error: ") + e.what());
  } catch (const ExchangeRejection& e) {
    // Typically the order filled or was cancelled in the meantime.
    std::cerr << "[ExecutionCoordinator] Cancel of order " << client_id
              << " refused: " << e.what() << ", reconciling\n";
    requestResync("", "cancel refused");
  } catch (const TransientNetworkError& e) {
    std::cerr << "[ExecutionCoordinator] Cancel of order " << client_id
              << " failed: " << e.what() << ", reconciling\n";
    {
      std::lock_guard lock(cancel_mutex_);
      cancel_requested_.erase(client_id);  // The TTL sweep may try again
    }
    requestResync("", "cancel outcome unknown");
  }
}

// -----------------------------------------------------------------------------
// Resync
// -----------------------------------------------------------------------------
// Network calls run here on the decision loop; the results are pushed into
// the stream loop in this order: books, order state, balances. The balance
// report goes last so the exchange's figure wins over the ledger's own
// bookkeeping of the reconciled fills.
// -----------------------------------------------------------------------------
void ExecutionCoordinator::performResync(const std::string& symbol) {
  ++resyncs_;
  const std::vector<std::string> symbols =
      symbol.empty() ? config_.symbols : std::vector<std::string>{symbol};
  std::cout << "[ExecutionCoordinator] Resync "
            << (symbol.empty() ? std::string("(all)") : symbol) << std::endl;

  try {
    for (const auto& s : symbols) {
      BookSnapshotEvent snapshot;
      snapshot.book = transport_.fetchBook(s);
      snapshot.timestamp = std::chrono::system_clock::now();
      stream_loop_.push(std::move(snapshot));
    }

    ReconcileEvent reconcile = collectOrderState();
    if (!reconcile.complete) {
      resync_retry_.store(true);
    }
    stream_loop_.push(std::move(reconcile));

    for (const auto& balance : transport_.fetchBalances()) {
      BalanceEvent event;
      event.asset = balance.asset;
      event.available = balance.available;
      event.total = balance.total;
      event.timestamp = std::chrono::system_clock::now();
      stream_loop_.push(std::move(event));
    }

    if (!symbol.empty()) {
      transport_.requestResync(symbol);
    }
  } catch (const AuthError& e) {
    halt(std::string("authentication failed during resync: ") + e.what());
  } catch (const ConfigError& e) {
    halt(std::string("configuration error during resync: ") + e.what());
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionCoordinator] Resync failed: " << e.what()
              << ", will retry\n";
    resync_retry_.store(true);
  }
}

ReconcileEvent ExecutionCoordinator::collectOrderState() {
  ReconcileEvent reconcile;
  reconcile.open_orders = transport_.fetchOpenOrders();

  for (const auto& order : ledger_.reconciliationCandidates(reconcile.open_orders)) {
    try {
      auto report = transport_.queryOrder(order);
      if (report) {
        reconcile.final_reports.push_back(std::move(*report));
      } else {
        reconcile.unknown_orders.push_back(order.id);
      }
    } catch (const AuthError&) {
      throw;
    } catch (const ConfigError&) {
      throw;
    } catch (const std::exception& e) {
      std::cerr << "[ExecutionCoordinator] Query of order " << order.id
                << " failed: " << e.what() << "\n";
      reconcile.complete = false;
    }
  }
  reconcile.timestamp = std::chrono::system_clock::now();
  return reconcile;
}

void ExecutionCoordinator::reconcilePendingOnShutdown() {
  const auto pending =
      ledger_.pendingOlderThan(std::numeric_limits<std::int64_t>::max());
  if (pending.empty()) {
    return;
  }
  std::cout << "[ExecutionCoordinator] " << pending.size()
            << " order(s) still Pending at shutdown, reconciling" << std::endl;
  try {
    stream_loop_.push(collectOrderState());
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionCoordinator] Shutdown reconciliation failed: "
              << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// Timer thread
// -----------------------------------------------------------------------------
void ExecutionCoordinator::timerLoop() {
  const std::int64_t start = steadyMs();
  std::int64_t next_tick = start + config_.decision_interval_ms;
  std::int64_t next_sweep = start + kSweepIntervalMs;
  std::int64_t next_save = start + config_.save_interval_ms;
  std::int64_t next_retry = start + kResyncRetryMs;

  while (true) {
    {
      std::unique_lock lock(timer_mutex_);
      timer_cv_.wait_for(lock, kTimerSlice,
                         [this] { return !running_.load(); });
      if (!running_.load()) {
        return;
      }
    }

    const std::int64_t now = steadyMs();
    if (config_.decision_interval_ms > 0 && now >= next_tick) {
      requestDecision("");
      next_tick = now + config_.decision_interval_ms;
    }
    if (now >= next_sweep) {
      if (config_.pending_timeout_ms > 0) {
        sweepPending();
      }
      if (config_.order_ttl_ms > 0) {
        sweepExpired();
      }
      next_sweep = now + kSweepIntervalMs;
    }
    if (now >= next_retry && resync_retry_.exchange(false)) {
      requestResync("", "retry after incomplete resync");
      next_retry = now + kResyncRetryMs;
    }
    if (config_.save_interval_ms > 0 && now >= next_save) {
      saveSnapshot();
      next_save = now + config_.save_interval_ms;
    }
  }
}

void ExecutionCoordinator::sweepPending() {
  const auto stale = ledger_.pendingOlderThan(nowMs() - config_.pending_timeout_ms);
  if (stale.empty()) {
    return;
  }
  std::cout << "[ExecutionCoordinator] " << stale.size()
            << " order(s) Pending longer than " << config_.pending_timeout_ms
            << " ms, reconciling" << std::endl;
  requestResync("", "pending timeout");
}

void ExecutionCoordinator::sweepExpired() {
  const std::int64_t cutoff = nowMs() - config_.order_ttl_ms;
  std::set<domain::OrderId> open_ids;
  std::size_t expired = 0;
  for (const auto& order : ledger_.openOrders()) {
    open_ids.insert(order.id);
    if (order.type != domain::OrderType::Limit ||
        order.status == domain::OrderStatus::Pending ||
        order.created_ms >= cutoff) {
      continue;
    }
    {
      std::lock_guard lock(cancel_mutex_);
      if (cancel_requested_.count(order.id) != 0) {
        continue;
      }
    }
    if (requestCancel(order.id, "order ttl expired")) {
      ++expired;
    }
  }

  {
    std::lock_guard lock(cancel_mutex_);
    for (auto it = cancel_requested_.begin(); it != cancel_requested_.end();) {
      it = open_ids.count(*it) == 0 ? cancel_requested_.erase(it) : std::next(it);
    }
  }

  if (expired > 0) {
    std::cout << "[ExecutionCoordinator] " << expired
              << " order(s) older than " << config_.order_ttl_ms
              << " ms, cancelling" << std::endl;
  }
}

void ExecutionCoordinator::saveSnapshot() {
  if (store_ == nullptr) {
    return;
  }
  try {
    store_->save(ledger_.snapshot());
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionCoordinator] Snapshot save failed: " << e.what()
              << "\n";
  }
}

void ExecutionCoordinator::emitTelemetry(const Event& event) {
  if (telemetry_ != nullptr) {
    telemetry_->publish(event);
  }
}

}  // namespace bgcore
