#include "bgcore/ledger/order_ledger.hpp"

#include "bgcore/events/order_update_event.hpp"
#include "bgcore/events/position_update_event.hpp"
#include "bgcore/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <type_traits>

namespace bgcore {

namespace {

constexpr double kQuantityEpsilon = 1e-9;

using domain::OrderStatus;

}  // namespace

const char* toString(OrderLedger::ApplyResult result) {
  switch (result) {
    case OrderLedger::ApplyResult::Applied:
      return "Applied";
    case OrderLedger::ApplyResult::Duplicate:
      return "Duplicate";
    case OrderLedger::ApplyResult::Refused:
      return "Refused";
    case OrderLedger::ApplyResult::UnknownOrder:
      return "UnknownOrder";
    case OrderLedger::ApplyResult::Ignored:
      return "Ignored";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// applyFillToPosition: weighted average on increase, realized P&L on reduce,
// close-then-open on reversal
// -----------------------------------------------------------------------------
double applyFillToPosition(domain::Position& pos, double signed_quantity,
                           double price) {
  const double current = pos.net_quantity;

  if (std::abs(current) < kQuantityEpsilon) {
    pos.net_quantity = signed_quantity;
    pos.average_price = price;
    return 0.0;
  }

  const bool same_direction = (current > 0.0) == (signed_quantity > 0.0);
  if (same_direction) {
    const double total = current + signed_quantity;
    pos.average_price =
        (current * pos.average_price + signed_quantity * price) / total;
    pos.net_quantity = total;
    return 0.0;
  }

  // +1 when closing a long, -1 when closing a short.
  const double direction = current > 0.0 ? 1.0 : -1.0;
  const double abs_current = std::abs(current);
  const double abs_fill = std::abs(signed_quantity);

  if (abs_fill <= abs_current + kQuantityEpsilon) {
    const double pnl = abs_fill * (price - pos.average_price) * direction;
    pos.realized_pnl += pnl;
    pos.net_quantity = current + signed_quantity;
    if (std::abs(pos.net_quantity) < kQuantityEpsilon) {
      pos.net_quantity = 0.0;
      pos.average_price = 0.0;
    }
    return pnl;
  }

  // Reversal: close everything, open the rest the other way.
  const double pnl = abs_current * (price - pos.average_price) * direction;
  pos.realized_pnl += pnl;
  pos.net_quantity = (signed_quantity > 0.0 ? 1.0 : -1.0) * (abs_fill - abs_current);
  pos.average_price = price;
  return pnl;
}

OrderLedger::OrderLedger(const ExchangeSession& session, EventBus* bus)
    : session_(session), bus_(bus) {}

std::int64_t OrderLedger::nowMs() const { return session_.clock().now_ms(); }

domain::Balance& OrderLedger::marginBalanceLocked() {
  domain::Balance& balance = balances_[session_.marginCoin()];
  if (balance.asset.empty()) {
    balance.asset = session_.marginCoin();
  }
  return balance;
}

domain::Position& OrderLedger::positionLocked(const std::string& symbol) {
  domain::Position& pos = positions_[symbol];
  if (pos.symbol.empty()) {
    pos.symbol = symbol;
  }
  return pos;
}

void OrderLedger::publish(Outbox& out) {
  if (!bus_) {
    return;
  }
  for (const auto& event : out) {
    bus_->publish(event);
  }
}

// -----------------------------------------------------------------------------
// registerOrder
// -----------------------------------------------------------------------------
bool OrderLedger::registerOrder(const domain::Order& order) {
  Outbox out;
  {
    std::unique_lock lock(mutex_);
    if (orders_.count(order.id) != 0) {
      std::cerr << "[OrderLedger] WARNING: client id " << order.id
                << " already registered. Skipping.\n";
      return false;
    }

    Entry entry;
    entry.order = order;
    entry.order.status = OrderStatus::Pending;
    entry.order.filled_quantity = 0.0;
    entry.order.average_fill_price = 0.0;
    if (entry.order.created_ms == 0) {
      entry.order.created_ms = nowMs();
    }
    entry.order.updated_ms = entry.order.created_ms;

    if (!order.reduce_only) {
      entry.reserved = order.price * order.quantity;
      domain::Balance& balance = marginBalanceLocked();
      balance.available -= entry.reserved;
      balance.reserved += entry.reserved;
    }

    Entry& stored = orders_.emplace(order.id, std::move(entry)).first->second;
    if (!order.exchange_id.empty()) {
      by_exchange_id_[order.exchange_id] = order.id;
    }

    OrderUpdateEvent update;
    update.order = stored.order;
    update.previous_status = OrderStatus::Pending;
    update.timestamp = ms_to_timestamp(stored.order.created_ms);
    out.push_back(update);
  }
  publish(out);
  return true;
}

// -----------------------------------------------------------------------------
// applyEvent: dispatch by event type under the exclusive lock
// -----------------------------------------------------------------------------
OrderLedger::ApplyResult OrderLedger::applyEvent(const Event& event) {
  Outbox out;
  ApplyResult result = ApplyResult::Ignored;
  {
    std::unique_lock lock(mutex_);
    result = std::visit(
        [&](const auto& e) -> ApplyResult {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, OrderAckEvent>) {
            return onAck(e, out);
          } else if constexpr (std::is_same_v<T, FillEvent>) {
            return onFill(e, out);
          } else if constexpr (std::is_same_v<T, CancelAckEvent>) {
            return onCancel(e, out);
          } else if constexpr (std::is_same_v<T, RejectEvent>) {
            return onReject(e, out);
          } else if constexpr (std::is_same_v<T, BalanceEvent>) {
            return onBalance(e);
          } else if constexpr (std::is_same_v<T, ReconcileEvent>) {
            reconcileLocked(e, out);
            return ApplyResult::Applied;
          } else if constexpr (std::is_same_v<T, TickerEvent>) {
            if (e.last_price <= 0.0) {
              return ApplyResult::Ignored;
            }
            markLocked(e.symbol, e.last_price);
            return ApplyResult::Applied;
          } else if constexpr (std::is_same_v<T, TradeEvent>) {
            if (e.price <= 0.0) {
              return ApplyResult::Ignored;
            }
            markLocked(e.symbol, e.price);
            return ApplyResult::Applied;
          } else {
            return ApplyResult::Ignored;
          }
        },
        event);

    if (result == ApplyResult::Applied) {
      const std::uint64_t seq =
          std::visit([](const auto& e) { return e.sequence_id; }, event);
      last_sequence_ = std::max(last_sequence_, seq);
    }
  }
  publish(out);
  return result;
}

void OrderLedger::reconcile(const ReconcileEvent& event) {
  applyEvent(Event{event});
}

// -----------------------------------------------------------------------------
// Lookup
// -----------------------------------------------------------------------------
OrderLedger::Entry* OrderLedger::findLocked(domain::OrderId client_id,
                                            const std::string& exchange_id) {
  if (client_id != 0) {
    auto it = orders_.find(client_id);
    if (it != orders_.end()) {
      return &it->second;
    }
  }
  if (!exchange_id.empty()) {
    auto ex = by_exchange_id_.find(exchange_id);
    if (ex != by_exchange_id_.end()) {
      auto it = orders_.find(ex->second);
      if (it != orders_.end()) {
        return &it->second;
      }
    }
  }
  return nullptr;
}

OrderLedger::Entry* OrderLedger::findLocked(const OrderStatusReport& report) {
  return findLocked(report.client_id, report.exchange_id);
}

void OrderLedger::indexExchangeIdLocked(Entry& entry,
                                        const std::string& exchange_id) {
  entry.order.exchange_id = exchange_id;
  by_exchange_id_[exchange_id] = entry.order.id;
}

// -----------------------------------------------------------------------------
// Transitions
// -----------------------------------------------------------------------------
void OrderLedger::setStatusLocked(Entry& entry, OrderStatus next, Outbox& out) {
  OrderUpdateEvent update;
  update.previous_status = entry.order.status;
  entry.order.status = next;
  entry.order.updated_ms = nowMs();
  if (domain::isTerminal(next)) {
    releaseLocked(entry);
  }
  update.order = entry.order;
  update.timestamp = ms_to_timestamp(entry.order.updated_ms);
  out.push_back(update);
}

void OrderLedger::releaseLocked(Entry& entry) {
  if (entry.reserved <= 0.0) {
    return;
  }
  domain::Balance& balance = marginBalanceLocked();
  balance.available += entry.reserved;
  balance.reserved = std::max(0.0, balance.reserved - entry.reserved);
  entry.reserved = 0.0;
}

OrderLedger::ApplyResult OrderLedger::onAck(const OrderAckEvent& event,
                                            Outbox& out) {
  Entry* entry = findLocked(event.client_id, event.exchange_id);
  if (!entry) {
    std::cerr << "[OrderLedger] WARNING: ack for unknown order client_id="
              << event.client_id << " exchange_id=" << event.exchange_id
              << ". Skipping.\n";
    return ApplyResult::UnknownOrder;
  }

  if (!event.exchange_id.empty() && entry->order.exchange_id.empty()) {
    indexExchangeIdLocked(*entry, event.exchange_id);
  }
  if (entry->order.status != OrderStatus::Pending) {
    return ApplyResult::Duplicate;
  }
  setStatusLocked(*entry, OrderStatus::Acknowledged, out);
  return ApplyResult::Applied;
}

OrderLedger::ApplyResult OrderLedger::onFill(const FillEvent& event,
                                             Outbox& out) {
  Entry* entry = findLocked(event.client_id, event.exchange_id);
  if (!entry) {
    std::cerr << "[OrderLedger] WARNING: fill " << event.fill_id
              << " for unknown order client_id=" << event.client_id
              << " exchange_id=" << event.exchange_id << ". Skipping.\n";
    return ApplyResult::UnknownOrder;
  }
  domain::Order& order = entry->order;

  if (!event.fill_id.empty() && entry->fill_ids.count(event.fill_id) != 0) {
    return ApplyResult::Duplicate;
  }

  if (entry->reconciled && domain::isTerminal(order.status)) {
    if (!event.fill_id.empty()) {
      entry->fill_ids.insert(event.fill_id);
    }
    std::cout << "[OrderLedger] Order " << order.id
              << " already reconciled, ignoring fill " << event.fill_id
              << std::endl;
    return ApplyResult::Duplicate;
  }

  if (order.status == OrderStatus::Filled ||
      order.status == OrderStatus::Rejected) {
    std::cerr << "[OrderLedger] WARNING: fill " << event.fill_id << " on "
              << domain::toString(order.status) << " order " << order.id
              << ". Skipping.\n";
    return ApplyResult::Refused;
  }

  if (!event.fill_id.empty()) {
    entry->fill_ids.insert(event.fill_id);
  }
  if (!event.exchange_id.empty() && order.exchange_id.empty()) {
    indexExchangeIdLocked(*entry, event.exchange_id);
  }

  double quantity = event.quantity;
  if (entry->unattributed_quantity > kQuantityEpsilon) {
    const double absorbed = std::min(quantity, entry->unattributed_quantity);
    entry->unattributed_quantity -= absorbed;
    quantity -= absorbed;
    if (quantity <= kQuantityEpsilon) {
      return ApplyResult::Duplicate;
    }
  }

  const double remaining = order.remainingQuantity();
  if (remaining <= kQuantityEpsilon) {
    std::cerr << "[OrderLedger] WARNING: fill " << event.fill_id
              << " exceeds quantity of order " << order.id << ". Skipping.\n";
    return ApplyResult::Refused;
  }
  if (quantity > remaining + kQuantityEpsilon) {
    std::cerr << "[OrderLedger] WARNING: fill " << event.fill_id << " of "
              << quantity << " clamped to remaining " << remaining
              << " on order " << order.id << "\n";
  }
  quantity = std::min(quantity, remaining);

  applyFillLocked(*entry, quantity, event.price, event.fee, out);
  return ApplyResult::Applied;
}

void OrderLedger::applyFillLocked(Entry& entry, double quantity, double price,
                                  double fee, Outbox& out) {
  domain::Order& order = entry.order;
  const double filled_before = order.filled_quantity;
  order.average_fill_price =
      (filled_before * order.average_fill_price + quantity * price) /
      (filled_before + quantity);
  order.filled_quantity = filled_before + quantity;
  if (order.quantity - order.filled_quantity <= kQuantityEpsilon) {
    order.filled_quantity = order.quantity;
  }

  // Balance and position move together in this step.
  domain::Balance& balance = marginBalanceLocked();
  double released = 0.0;
  if (entry.reserved > 0.0) {
    released = std::min(entry.reserved, quantity * order.price);
    entry.reserved -= released;
    balance.reserved = std::max(0.0, balance.reserved - released);
  }

  domain::Position& pos = positionLocked(order.symbol);
  const double old_margin = margin_[order.symbol];
  const double pnl =
      applyFillToPosition(pos, domain::sideSign(order.side) * quantity, price);
  const double new_margin = std::abs(pos.net_quantity) * pos.average_price;
  margin_[order.symbol] = new_margin;

  balance.available += released + (old_margin - new_margin) + pnl - fee;
  if (balance.total > 0.0) {
    balance.total += pnl - fee;
  }

  auto mark = marks_.find(order.symbol);
  if (mark != marks_.end()) {
    pos.unrealized_pnl = pos.net_quantity * (mark->second - pos.average_price);
  } else {
    pos.unrealized_pnl = 0.0;
  }

  if (order.status == OrderStatus::Cancelled) {
    OrderUpdateEvent update;
    update.previous_status = OrderStatus::Cancelled;
    order.updated_ms = nowMs();
    update.order = order;
    update.timestamp = ms_to_timestamp(order.updated_ms);
    out.push_back(update);
    if (entry.settle_pending &&
        order.filled_quantity >= entry.reported_cumulative - kQuantityEpsilon) {
      entry.settle_pending = false;
    }
    std::cout << "[OrderLedger] Late fill of " << quantity << " applied to "
              << "cancelled order " << order.id << std::endl;
  } else {
    const bool complete = order.remainingQuantity() <= kQuantityEpsilon;
    setStatusLocked(entry,
                    complete ? OrderStatus::Filled : OrderStatus::PartiallyFilled,
                    out);
  }

  PositionUpdateEvent position_update;
  position_update.position = pos;
  position_update.balance = balance;
  position_update.timestamp = ms_to_timestamp(order.updated_ms);
  out.push_back(position_update);
}

OrderLedger::ApplyResult OrderLedger::onCancel(const CancelAckEvent& event,
                                               Outbox& out) {
  Entry* entry = findLocked(event.client_id, event.exchange_id);
  if (!entry) {
    std::cerr << "[OrderLedger] WARNING: cancel for unknown order client_id="
              << event.client_id << " exchange_id=" << event.exchange_id
              << ". Skipping.\n";
    return ApplyResult::UnknownOrder;
  }
  domain::Order& order = entry->order;

  if (!event.exchange_id.empty() && order.exchange_id.empty()) {
    indexExchangeIdLocked(*entry, event.exchange_id);
  }
  if (event.cumulative_filled > entry->reported_cumulative) {
    entry->reported_cumulative = event.cumulative_filled;
  }
  const bool fills_outstanding =
      entry->reported_cumulative > order.filled_quantity + kQuantityEpsilon;

  switch (order.status) {
    case OrderStatus::Cancelled:
      if (fills_outstanding && !entry->reconciled) {
        entry->settle_pending = true;
      }
      return ApplyResult::Duplicate;
    case OrderStatus::Filled:
      // The last fill beat the cancel request.
      return ApplyResult::Duplicate;
    case OrderStatus::Rejected:
      std::cerr << "[OrderLedger] WARNING: cancel for rejected order "
                << order.id << ". Skipping.\n";
      return ApplyResult::Refused;
    case OrderStatus::Pending:
    case OrderStatus::Acknowledged:
    case OrderStatus::PartiallyFilled:
      break;
  }

  setStatusLocked(*entry, OrderStatus::Cancelled, out);
  std::cout << "[OrderLedger] Order " << order.id << " cancelled"
            << (event.exchange_initiated ? " by the exchange" : "");
  if (!event.reason.empty()) {
    std::cout << ": " << event.reason;
  }
  std::cout << std::endl;
  if (fills_outstanding) {
    entry->settle_pending = true;
    std::cout << "[OrderLedger] Order " << order.id << " awaiting "
              << entry->reported_cumulative - order.filled_quantity
              << " of reported fills" << std::endl;
  }
  return ApplyResult::Applied;
}

OrderLedger::ApplyResult OrderLedger::onReject(const RejectEvent& event,
                                               Outbox& out) {
  Entry* entry = findLocked(event.client_id, event.exchange_id);
  if (!entry) {
    std::cerr << "[OrderLedger] WARNING: reject for unknown order client_id="
              << event.client_id << ". Skipping.\n";
    return ApplyResult::UnknownOrder;
  }
  if (entry->order.status == OrderStatus::Rejected) {
    return ApplyResult::Duplicate;
  }
  if (entry->order.status != OrderStatus::Pending) {
    std::cerr << "[OrderLedger] WARNING: reject for "
              << domain::toString(entry->order.status) << " order "
              << entry->order.id << ". Skipping.\n";
    return ApplyResult::Refused;
  }
  setStatusLocked(*entry, OrderStatus::Rejected, out);
  std::cerr << "[OrderLedger] Order " << entry->order.id << " rejected ("
            << event.code << "): " << event.reason << "\n";
  return ApplyResult::Applied;
}

OrderLedger::ApplyResult OrderLedger::onBalance(const BalanceEvent& event) {
  if (event.asset != session_.marginCoin()) {
    domain::Balance& other = balances_[event.asset];
    other.asset = event.asset;
    other.available = event.available;
    other.total = event.total;
    return ApplyResult::Applied;
  }

  domain::Balance& balance = marginBalanceLocked();
  if (event.total > 0.0) {
    balance.total = event.total;
    balance.available =
        std::min(event.available, event.total - balance.reserved);
  } else {
    balance.available = event.available - balance.reserved;
  }
  return ApplyResult::Applied;
}

void OrderLedger::markToMarket(const std::string& symbol, double mark_price) {
  std::unique_lock lock(mutex_);
  markLocked(symbol, mark_price);
}

void OrderLedger::markLocked(const std::string& symbol, double mark_price) {
  marks_[symbol] = mark_price;
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return;
  }
  domain::Position& pos = it->second;
  pos.unrealized_pnl = pos.net_quantity * (mark_price - pos.average_price);
}

// -----------------------------------------------------------------------------
// Reconciliation
// -----------------------------------------------------------------------------
std::vector<domain::Order> OrderLedger::reconciliationCandidates(
    const std::vector<OrderStatusReport>& open_orders) const {
  std::set<domain::OrderId> open_ids;
  std::set<std::string> open_exchange_ids;
  for (const auto& report : open_orders) {
    if (report.client_id != 0) {
      open_ids.insert(report.client_id);
    }
    if (!report.exchange_id.empty()) {
      open_exchange_ids.insert(report.exchange_id);
    }
  }

  std::shared_lock lock(mutex_);
  std::vector<domain::Order> candidates;
  for (const auto& [id, entry] : orders_) {
    const bool unresolved =
        !domain::isTerminal(entry.order.status) || entry.settle_pending;
    if (!unresolved) {
      continue;
    }
    if (open_ids.count(id) != 0 ||
        (!entry.order.exchange_id.empty() &&
         open_exchange_ids.count(entry.order.exchange_id) != 0)) {
      continue;
    }
    candidates.push_back(entry.order);
  }
  return candidates;
}

void OrderLedger::reconcileLocked(const ReconcileEvent& event, Outbox& out) {
  for (const auto& report : event.open_orders) {
    Entry* entry = findLocked(report);
    if (!entry) {
      adoptLocked(report, out);
      continue;
    }
    catchUpLocked(*entry, report, out);
  }

  for (const auto& report : event.final_reports) {
    Entry* entry = findLocked(report);
    if (!entry) {
      std::cerr << "[OrderLedger] WARNING: final report for unknown order "
                << report.client_id << ". Skipping.\n";
      continue;
    }
    catchUpLocked(*entry, report, out);
    if (!domain::isTerminal(report.status)) {
      continue;
    }

    entry->reconciled = true;
    entry->settle_pending = false;
    entry->unattributed_quantity = 0.0;
    if (entry->order.status != report.status) {
      std::cout << "[OrderLedger] Reconciled order " << entry->order.id << ": "
                << domain::toString(entry->order.status) << " -> "
                << domain::toString(report.status) << std::endl;
      setStatusLocked(*entry, report.status, out);
    } else {
      releaseLocked(*entry);
    }
  }

  for (domain::OrderId id : event.unknown_orders) {
    auto it = orders_.find(id);
    if (it == orders_.end()) {
      continue;
    }
    Entry& entry = it->second;
    entry.settle_pending = false;
    if (domain::isTerminal(entry.order.status)) {
      continue;
    }
    std::cerr << "[OrderLedger] Order " << id
              << " unknown to the exchange, forcing Rejected\n";
    entry.reconciled = true;
    setStatusLocked(entry, OrderStatus::Rejected, out);
  }
}

void OrderLedger::catchUpLocked(Entry& entry, const OrderStatusReport& report,
                                Outbox& out) {
  domain::Order& order = entry.order;
  if (!report.exchange_id.empty() && order.exchange_id.empty()) {
    indexExchangeIdLocked(entry, report.exchange_id);
  }

  const double missing = report.filled_quantity - order.filled_quantity;
  if (missing > kQuantityEpsilon && !entry.reconciled) {
    const double quantity = std::min(missing, order.remainingQuantity());
    if (quantity > kQuantityEpsilon) {
      // Average price of the quantity the ledger has not seen.
      double price = order.price;
      if (report.average_fill_price > 0.0) {
        price = (report.filled_quantity * report.average_fill_price -
                 order.filled_quantity * order.average_fill_price) /
                missing;
        if (!(price > 0.0)) {
          price = report.average_fill_price;
        }
      }

      ++entry.synthetic_fills;
      entry.fill_ids.insert("reconcile-" + std::to_string(order.id) + "-" +
                            std::to_string(entry.synthetic_fills));
      std::cout << "[OrderLedger] Reconcile: applying missing " << quantity
                << " of order " << order.id << " at " << price << std::endl;
      applyFillLocked(entry, quantity, price, 0.0, out);
      if (!domain::isTerminal(report.status)) {
        entry.unattributed_quantity += quantity;
      }
    }
  }

  if (order.status == OrderStatus::Pending &&
      !domain::isTerminal(report.status)) {
    setStatusLocked(entry, OrderStatus::Acknowledged, out);
  }
}

void OrderLedger::adoptLocked(const OrderStatusReport& report, Outbox& out) {
  if (report.client_id == 0) {
    std::cout << "[OrderLedger] Ignoring open order " << report.exchange_id
              << " not placed by this engine" << std::endl;
    return;
  }

  Entry entry;
  domain::Order& order = entry.order;
  order.id = report.client_id;
  order.exchange_id = report.exchange_id;
  order.strategy_id = "adopted";
  order.symbol = report.symbol;
  order.side = report.side;
  order.type = report.type;
  order.price = report.price;
  order.quantity = report.quantity;
  order.filled_quantity = report.filled_quantity;
  order.average_fill_price = report.average_fill_price;
  order.status = domain::isTerminal(report.status) ? OrderStatus::Acknowledged
                                                   : report.status;
  order.created_ms = report.updated_ms != 0 ? report.updated_ms : nowMs();
  order.updated_ms = order.created_ms;

  entry.reserved = order.remainingQuantity() * order.price;
  domain::Balance& balance = marginBalanceLocked();
  balance.available -= entry.reserved;
  balance.reserved += entry.reserved;

  std::cout << "[OrderLedger] Adopting open order " << order.id << " ("
            << order.exchange_id << ") from the exchange" << std::endl;

  OrderUpdateEvent update;
  update.order = order;
  update.previous_status = OrderStatus::Pending;
  update.timestamp = ms_to_timestamp(order.updated_ms);
  out.push_back(update);

  const domain::OrderId id = order.id;
  const std::string exchange_id = order.exchange_id;
  orders_.emplace(id, std::move(entry));
  if (!exchange_id.empty()) {
    by_exchange_id_[exchange_id] = id;
  }
}

// -----------------------------------------------------------------------------
// Warm start and readers
// -----------------------------------------------------------------------------
void OrderLedger::hydrate(const LedgerSnapshot& snapshot) {
  std::unique_lock lock(mutex_);
  orders_.clear();
  by_exchange_id_.clear();
  positions_.clear();
  balances_.clear();
  margin_.clear();

  for (const auto& order : snapshot.open_orders) {
    Entry entry;
    entry.order = order;
    if (!order.reduce_only) {
      entry.reserved = order.remainingQuantity() * order.price;
    }
    if (!order.exchange_id.empty()) {
      by_exchange_id_[order.exchange_id] = order.id;
    }
    orders_.emplace(order.id, std::move(entry));
  }
  for (const auto& pos : snapshot.positions) {
    positions_[pos.symbol] = pos;
    margin_[pos.symbol] = std::abs(pos.net_quantity) * pos.average_price;
  }
  for (const auto& balance : snapshot.balances) {
    balances_[balance.asset] = balance;
  }
  last_sequence_ = snapshot.last_sequence;

  std::cout << "[OrderLedger] Hydrated " << orders_.size() << " open orders, "
            << positions_.size() << " positions" << std::endl;
}

void OrderLedger::setBalance(const domain::Balance& balance) {
  std::unique_lock lock(mutex_);
  domain::Balance& target = balance.asset.empty() ? marginBalanceLocked()
                                                  : balances_[balance.asset];
  const std::string asset =
      balance.asset.empty() ? session_.marginCoin() : balance.asset;
  target = balance;
  target.asset = asset;
}

LedgerView OrderLedger::view() const {
  std::shared_lock lock(mutex_);
  LedgerView view;
  view.margin_coin = session_.marginCoin();
  for (const auto& [id, entry] : orders_) {
    if (!domain::isTerminal(entry.order.status)) {
      view.open_orders.push_back(entry.order);
    }
  }
  view.positions = positions_;
  view.balances = balances_;
  for (const auto& [symbol, pos] : positions_) {
    view.realized_pnl += pos.realized_pnl;
  }
  view.last_sequence = last_sequence_;
  return view;
}

LedgerSnapshot OrderLedger::snapshot() const {
  std::shared_lock lock(mutex_);
  LedgerSnapshot snap;
  domain::OrderId max_id = 0;
  for (const auto& [id, entry] : orders_) {
    max_id = std::max(max_id, id);
    if (!domain::isTerminal(entry.order.status)) {
      snap.open_orders.push_back(entry.order);
    }
  }
  for (const auto& [symbol, pos] : positions_) {
    snap.positions.push_back(pos);
  }
  for (const auto& [asset, balance] : balances_) {
    snap.balances.push_back(balance);
  }
  snap.last_sequence = last_sequence_;
  snap.next_order_id = max_id + 1;
  snap.saved_ms = nowMs();
  return snap;
}

std::optional<domain::Order> OrderLedger::order(domain::OrderId id) const {
  std::shared_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second.order;
}

std::vector<domain::Order> OrderLedger::openOrders() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Order> open;
  for (const auto& [id, entry] : orders_) {
    if (!domain::isTerminal(entry.order.status)) {
      open.push_back(entry.order);
    }
  }
  return open;
}

std::size_t OrderLedger::openOrderCount() const {
  std::shared_lock lock(mutex_);
  std::size_t count = 0;
  for (const auto& [id, entry] : orders_) {
    if (!domain::isTerminal(entry.order.status)) {
      ++count;
    }
  }
  return count;
}

std::vector<domain::Order> OrderLedger::pendingOlderThan(
    std::int64_t cutoff_ms) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Order> stale;
  for (const auto& [id, entry] : orders_) {
    if (entry.order.status == OrderStatus::Pending &&
        entry.order.created_ms < cutoff_ms) {
      stale.push_back(entry.order);
    }
  }
  return stale;
}

domain::Position OrderLedger::position(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  if (it != positions_.end()) {
    return it->second;
  }
  domain::Position flat;
  flat.symbol = symbol;
  return flat;
}

domain::Balance OrderLedger::balance() const {
  std::shared_lock lock(mutex_);
  auto it = balances_.find(session_.marginCoin());
  if (it != balances_.end()) {
    return it->second;
  }
  domain::Balance empty;
  empty.asset = session_.marginCoin();
  return empty;
}

double OrderLedger::realizedPnl() const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    total += pos.realized_pnl;
  }
  return total;
}

std::uint64_t OrderLedger::lastSequence() const {
  std::shared_lock lock(mutex_);
  return last_sequence_;
}

domain::OrderId OrderLedger::maxOrderId() const {
  std::shared_lock lock(mutex_);
  return orders_.empty() ? 0 : orders_.rbegin()->first;
}

}  // namespace bgcore
