#include "bgcore/exchange/simulated_transport.hpp"

#include "bgcore/domain/errors.hpp"
#include "bgcore/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace bgcore {

namespace {

constexpr double kQuantityEpsilon = 1e-12;

}  // namespace

SimulatedTransport::SimulatedTransport(ExchangeSession& session,
                                       SimulatedTransportConfig config,
                                       IExchangeTransport* market_data)
    : session_(session),
      config_(std::move(config)),
      market_data_(market_data),
      equity_(config_.initial_balance) {}

SimulatedTransport::~SimulatedTransport() { stopStream(); }

void SimulatedTransport::setNextSubmitFailure(SubmitFailure failure) {
  std::lock_guard lock(mutex_);
  next_failure_ = failure;
}

void SimulatedTransport::setAutoEmit(bool auto_emit) {
  std::lock_guard lock(mutex_);
  auto_emit_ = auto_emit;
}

std::vector<Event> SimulatedTransport::takeHeldEvents() {
  std::lock_guard lock(mutex_);
  std::vector<Event> out;
  out.swap(held_);
  return out;
}

std::size_t SimulatedTransport::submittedCount() const {
  std::lock_guard lock(mutex_);
  return submitted_;
}

std::size_t SimulatedTransport::resyncRequests() const {
  std::lock_guard lock(mutex_);
  return resync_requests_;
}

void SimulatedTransport::emit(std::vector<Event> events) {
  if (events.empty()) {
    return;
  }
  EventSink sink;
  {
    std::lock_guard lock(mutex_);
    if (!auto_emit_) {
      for (auto& event : events) {
        held_.push_back(std::move(event));
      }
      return;
    }
    if (!streaming_) {
      return;
    }
    sink = sink_;
  }
  for (auto& event : events) {
    sink(std::move(event));
  }
}

// -----------------------------------------------------------------------------
// Account model
// -----------------------------------------------------------------------------

double SimulatedTransport::availableLocked() const {
  double used = 0.0;
  for (const auto& [symbol, position] : positions_) {
    used += std::abs(position.net) * position.average_price;
  }
  for (const auto& [id, sim] : orders_) {
    if (!domain::isTerminal(sim.status)) {
      used += sim.order.remainingQuantity() * sim.order.price;
    }
  }
  return equity_ - used;
}

bool SimulatedTransport::crossesLocked(const domain::Order& order) const {
  auto it = quotes_.find(order.symbol);
  if (it == quotes_.end()) {
    return false;
  }
  const Quote& q = it->second;
  if (order.side == domain::Side::Buy) {
    const double ask = q.ask > 0.0 ? q.ask : q.last;
    return ask > 0.0 && order.price >= ask;
  }
  const double bid = q.bid > 0.0 ? q.bid : q.last;
  return bid > 0.0 && order.price <= bid;
}

// -----------------------------------------------------------------------------
// fillLocked(): full fill of the remaining quantity at `price`
// -----------------------------------------------------------------------------
void SimulatedTransport::fillLocked(SimOrder& sim, double price,
                                    std::vector<Event>& out) {
  const double qty = sim.order.remainingQuantity();
  if (qty <= kQuantityEpsilon) {
    return;
  }
  const double fee = qty * price * config_.fee_rate;

  SimPosition& pos = positions_[sim.order.symbol];
  const double signed_qty = domain::sideSign(sim.order.side) * qty;
  if (pos.net == 0.0 || (pos.net > 0.0) == (signed_qty > 0.0)) {
    const double total = std::abs(pos.net) + qty;
    pos.average_price = (std::abs(pos.net) * pos.average_price + qty * price) / total;
    pos.net += signed_qty;
  } else {
    const double closing = std::min(qty, std::abs(pos.net));
    const double direction = pos.net > 0.0 ? 1.0 : -1.0;
    equity_ += closing * (price - pos.average_price) * direction;
    pos.net += signed_qty;
    if (std::abs(pos.net) <= kQuantityEpsilon) {
      pos.net = 0.0;
      pos.average_price = 0.0;
    } else if ((pos.net > 0.0) != (direction > 0.0)) {
      pos.average_price = price;  // Flipped through zero
    }
  }
  equity_ -= fee;

  const double prev_filled = sim.order.filled_quantity;
  sim.order.filled_quantity += qty;
  sim.order.average_fill_price =
      (prev_filled * sim.order.average_fill_price + qty * price) /
      sim.order.filled_quantity;
  sim.status = domain::OrderStatus::Filled;

  FillEvent fill;
  fill.client_id = sim.order.id;
  fill.exchange_id = sim.exchange_id;
  fill.fill_id = "sim-fill-" + std::to_string(next_fill_id_++);
  fill.symbol = sim.order.symbol;
  fill.side = sim.order.side;
  fill.price = price;
  fill.quantity = qty;
  fill.fee = fee;
  fill.timestamp_ms = session_.clock().now_ms();
  fill.timestamp = ms_to_timestamp(fill.timestamp_ms);
  out.emplace_back(std::move(fill));
}

void SimulatedTransport::sweepRestingLocked(const std::string& symbol,
                                            std::vector<Event>& out) {
  for (auto& [id, sim] : orders_) {
    if (sim.order.symbol == symbol && !domain::isTerminal(sim.status) &&
        crossesLocked(sim.order)) {
      fillLocked(sim, sim.order.price, out);
    }
  }
}

OrderStatusReport SimulatedTransport::reportLocked(const SimOrder& sim) const {
  OrderStatusReport report;
  report.client_id = sim.order.id;
  report.exchange_id = sim.exchange_id;
  report.symbol = sim.order.symbol;
  report.side = sim.order.side;
  report.type = sim.order.type;
  report.price = sim.order.price;
  report.quantity = sim.order.quantity;
  report.filled_quantity = sim.order.filled_quantity;
  report.average_fill_price = sim.order.average_fill_price;
  report.status = sim.status;
  report.updated_ms = session_.clock().now_ms();
  return report;
}

// -----------------------------------------------------------------------------
// Order entry
// -----------------------------------------------------------------------------

OrderAck SimulatedTransport::submitOrder(const domain::Order& order) {
  std::vector<Event> out;
  OrderAck ack;
  SubmitFailure failure;
  {
    std::lock_guard lock(mutex_);
    failure = next_failure_;
    next_failure_ = SubmitFailure::None;

    switch (failure) {
      case SubmitFailure::Transient:
        throw TransientNetworkError("simulated: connection reset");
      case SubmitFailure::Auth:
        throw AuthError("simulated: 40009 sign signature error");
      case SubmitFailure::Reject:
        throw ExchangeRejection("40762", "The order amount exceeds the balance");
      case SubmitFailure::None:
      case SubmitFailure::AcceptedThenTransient:
        break;
    }

    if (!order.reduce_only && order.notional() > availableLocked() + 1e-9) {
      throw ExchangeRejection("40762", "The order amount exceeds the balance");
    }

    ++submitted_;
    SimOrder sim;
    sim.order = order;
    sim.exchange_id = "sim-" + std::to_string(next_exchange_id_++);
    sim.order.exchange_id = sim.exchange_id;
    sim.status = domain::OrderStatus::Acknowledged;
    SimOrder& stored = orders_[order.id] = sim;

    ack.client_id = order.id;
    ack.exchange_id = stored.exchange_id;

    OrderAckEvent event;
    event.client_id = order.id;
    event.exchange_id = stored.exchange_id;
    event.symbol = order.symbol;
    event.timestamp = ms_to_timestamp(session_.clock().now_ms());
    out.emplace_back(std::move(event));

    if (order.type == domain::OrderType::Market || crossesLocked(order)) {
      fillLocked(stored, order.price, out);
    }
  }

  emit(std::move(out));

  if (failure == SubmitFailure::AcceptedThenTransient) {
    throw TransientNetworkError("simulated: response lost after accept");
  }
  return ack;
}

CancelAck SimulatedTransport::cancelOrder(const domain::Order& order) {
  std::vector<Event> out;
  CancelAck ack;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(order.id);
    if (it == orders_.end() || domain::isTerminal(it->second.status)) {
      throw ExchangeRejection("40768", "Order does not exist");
    }
    SimOrder& sim = it->second;
    sim.status = domain::OrderStatus::Cancelled;

    CancelAckEvent event;
    event.client_id = sim.order.id;
    event.exchange_id = sim.exchange_id;
    event.symbol = sim.order.symbol;
    event.cumulative_filled = sim.order.filled_quantity;
    event.reason = "canceled";
    event.timestamp = ms_to_timestamp(session_.clock().now_ms());
    out.emplace_back(std::move(event));

    ack.client_id = sim.order.id;
    ack.exchange_id = sim.exchange_id;
  }
  emit(std::move(out));
  return ack;
}

std::optional<OrderStatusReport> SimulatedTransport::queryOrder(
    const domain::Order& order) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order.id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return reportLocked(it->second);
}

std::vector<OrderStatusReport> SimulatedTransport::fetchOpenOrders() {
  std::lock_guard lock(mutex_);
  std::vector<OrderStatusReport> out;
  for (const auto& [id, sim] : orders_) {
    if (!domain::isTerminal(sim.status)) {
      out.push_back(reportLocked(sim));
    }
  }
  return out;
}

domain::OrderBookSnapshot SimulatedTransport::fetchBook(const std::string& symbol) {
  if (market_data_) {
    return market_data_->fetchBook(symbol);
  }
  std::lock_guard lock(mutex_);
  auto it = books_.find(symbol);
  if (it != books_.end()) {
    return it->second;
  }
  domain::OrderBookSnapshot empty;
  empty.symbol = symbol;
  return empty;
}

std::vector<domain::Balance> SimulatedTransport::fetchBalances() {
  std::lock_guard lock(mutex_);
  domain::Balance balance;
  balance.asset = session_.marginCoin();
  balance.available = availableLocked();
  balance.total = equity_;
  return {balance};
}

std::vector<domain::Instrument> SimulatedTransport::fetchInstruments() {
  if (!config_.instruments.empty()) {
    return config_.instruments;
  }
  if (market_data_) {
    return market_data_->fetchInstruments();
  }
  return session_.instruments();
}

// -----------------------------------------------------------------------------
// Streaming
// -----------------------------------------------------------------------------

void SimulatedTransport::onMarketEvent(const Event& event) {
  std::vector<Event> out;
  out.push_back(event);
  {
    std::lock_guard lock(mutex_);
    if (const auto* snap = std::get_if<BookSnapshotEvent>(&event)) {
      books_[snap->book.symbol] = snap->book;
      Quote& q = quotes_[snap->book.symbol];
      if (const auto* bid = snap->book.bestBid()) {
        q.bid = bid->price;
      }
      if (const auto* ask = snap->book.bestAsk()) {
        q.ask = ask->price;
      }
      sweepRestingLocked(snap->book.symbol, out);
    } else if (const auto* ticker = std::get_if<TickerEvent>(&event)) {
      Quote& q = quotes_[ticker->symbol];
      q.bid = ticker->best_bid;
      q.ask = ticker->best_ask;
      q.last = ticker->last_price;
      sweepRestingLocked(ticker->symbol, out);
    } else if (const auto* trade = std::get_if<TradeEvent>(&event)) {
      quotes_[trade->symbol].last = trade->price;
      sweepRestingLocked(trade->symbol, out);
    }
  }

  // The market event itself always goes straight through; only order events
  // are subject to auto-emit.
  EventSink sink;
  bool auto_emit = true;
  {
    std::lock_guard lock(mutex_);
    if (!streaming_) {
      return;
    }
    sink = sink_;
    auto_emit = auto_emit_;
  }
  sink(std::move(out.front()));
  out.erase(out.begin());
  if (auto_emit) {
    for (auto& e : out) {
      sink(std::move(e));
    }
  } else {
    std::lock_guard lock(mutex_);
    for (auto& e : out) {
      held_.push_back(std::move(e));
    }
  }
}

void SimulatedTransport::startStream(EventSink sink) {
  {
    std::lock_guard lock(mutex_);
    if (streaming_) {
      return;
    }
    sink_ = std::move(sink);
    streaming_ = true;
  }

  if (market_data_) {
    market_data_->startStream([this](Event event) { onMarketEvent(event); });
    return;
  }

  StreamStatusEvent connected;
  connected.kind = StreamStatusEvent::Kind::Connected;
  connected.channel = "simulated";
  connected.reason = "paper session started";
  connected.timestamp = ms_to_timestamp(session_.clock().now_ms());
  std::cout << "[SimulatedTransport] Paper stream started" << std::endl;

  EventSink target;
  {
    std::lock_guard lock(mutex_);
    target = sink_;
  }
  target(std::move(connected));
}

void SimulatedTransport::stopStream() {
  if (market_data_) {
    market_data_->stopStream();
  }
  std::lock_guard lock(mutex_);
  streaming_ = false;
}

void SimulatedTransport::requestResync(const std::string& symbol) {
  {
    std::lock_guard lock(mutex_);
    ++resync_requests_;
  }
  if (market_data_) {
    market_data_->requestResync(symbol);
  }
}

}  // namespace bgcore
