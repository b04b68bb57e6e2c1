#include "bgcore/exchange/bitget_codec.hpp"

#include "bgcore/domain/errors.hpp"
#include "bgcore/time/time_utils.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <set>
#include <sstream>

namespace bgcore {
namespace bitget {

using json = nlohmann::json;

namespace {

// Bitget sends numbers as strings ("27350.5"), sometimes as JSON numbers,
// and "" or null for absent values.
double toDouble(const json& value) {
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_string()) {
    const auto& s = value.get_ref<const std::string&>();
    if (s.empty()) {
      return 0.0;
    }
    return std::strtod(s.c_str(), nullptr);
  }
  return 0.0;
}

std::int64_t toInt64(const json& value) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number()) {
    return static_cast<std::int64_t>(value.get<double>());
  }
  if (value.is_string()) {
    const auto& s = value.get_ref<const std::string&>();
    return s.empty() ? 0 : std::strtoll(s.c_str(), nullptr, 10);
  }
  return 0;
}

std::string toStr(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_null()) {
    return {};
  }
  return value.dump();
}

double field(const json& obj, const char* key) {
  auto it = obj.find(key);
  return it == obj.end() ? 0.0 : toDouble(*it);
}

std::int64_t intField(const json& obj, const char* key) {
  auto it = obj.find(key);
  return it == obj.end() ? 0 : toInt64(*it);
}

std::string strField(const json& obj, const char* key) {
  auto it = obj.find(key);
  return it == obj.end() ? std::string{} : toStr(*it);
}

domain::Side parseSide(const std::string& side) {
  return side == "sell" ? domain::Side::Sell : domain::Side::Buy;
}

std::vector<domain::PriceLevel> parseLevels(const json& levels) {
  std::vector<domain::PriceLevel> out;
  if (!levels.is_array()) {
    return out;
  }
  out.reserve(levels.size());
  for (const auto& level : levels) {
    if (level.is_array() && level.size() >= 2) {
      out.push_back({toDouble(level[0]), toDouble(level[1])});
    }
  }
  return out;
}

const std::set<std::string>& authCodes() {
  // Missing/invalid key, sign, timestamp or passphrase; expired timestamp.
  static const std::set<std::string> codes{
      "40001", "40002", "40003", "40005", "40006", "40008",
      "40009", "40011", "40012", "40014", "40037"};
  return codes;
}

const std::set<std::string>& retryableCodes() {
  // Too many requests, request timeout, system busy / maintenance.
  static const std::set<std::string> codes{"429", "40010", "40015", "40725",
                                           "45001"};
  return codes;
}

const std::set<std::string>& notFoundCodes() {
  static const std::set<std::string> codes{"40109", "40768", "43001"};
  return codes;
}

}  // namespace

std::string clientOid(domain::OrderId id) {
  return kClientOidPrefix + std::to_string(id);
}

domain::OrderId parseClientOid(const std::string& oid) {
  const std::string prefix = kClientOidPrefix;
  if (oid.size() <= prefix.size() || oid.compare(0, prefix.size(), prefix) != 0) {
    return 0;
  }
  domain::OrderId id = 0;
  for (std::size_t i = prefix.size(); i < oid.size(); ++i) {
    const char c = oid[i];
    if (c < '0' || c > '9') {
      return 0;
    }
    id = id * 10 + static_cast<domain::OrderId>(c - '0');
  }
  return id;
}

std::string formatDecimal(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision < 0 ? 0 : precision)
      << value;
  return out.str();
}

std::string buildQuery(
    const std::vector<std::pair<std::string, std::string>>& params) {
  std::string query;
  for (const auto& [key, value] : params) {
    query += query.empty() ? "?" : "&";
    query += key + "=" + value;
  }
  return query;
}

ErrorClass classifyError(long http_status, const std::string& code) {
  if (code == kSuccessCode && http_status < 400) {
    return ErrorClass::None;
  }
  if (authCodes().count(code) || http_status == 401 || http_status == 403) {
    return ErrorClass::Auth;
  }
  if (http_status == 429 || http_status >= 500 || retryableCodes().count(code)) {
    return ErrorClass::Retryable;
  }
  if (notFoundCodes().count(code)) {
    return ErrorClass::NotFound;
  }
  return ErrorClass::Rejection;
}

bool isNotFound(const std::string& code) {
  return notFoundCodes().count(code) > 0;
}

json unwrapEnvelope(long http_status, const std::string& body) {
  json envelope;
  try {
    envelope = json::parse(body);
  } catch (const json::exception& e) {
    throw TransientNetworkError("HTTP " + std::to_string(http_status) +
                                " with unparseable body: " + e.what());
  }

  const std::string code = envelope.is_object() ? strField(envelope, "code") : "";
  const std::string msg = envelope.is_object() ? strField(envelope, "msg") : "";

  switch (classifyError(http_status, code)) {
    case ErrorClass::None:
      return envelope.value("data", json());
    case ErrorClass::Retryable:
      if (code == "429" || http_status == 429) {
        throw RateLimitExceeded("exchange rate limit: " + msg);
      }
      throw TransientNetworkError("HTTP " + std::to_string(http_status) +
                                  " code " + code + ": " + msg);
    case ErrorClass::Auth:
      throw AuthError("code " + code + ": " + msg);
    case ErrorClass::NotFound:
    case ErrorClass::Rejection:
      break;
  }
  throw ExchangeRejection(code, msg);
}

json buildPlaceOrder(const domain::Order& order,
                     const domain::Instrument& instrument,
                     const std::string& product_type,
                     const std::string& margin_coin) {
  json body = {
      {"symbol", order.symbol},
      {"productType", product_type},
      {"marginMode", "crossed"},
      {"marginCoin", margin_coin},
      {"size", formatDecimal(order.quantity, instrument.quantity_precision)},
      {"side", order.side == domain::Side::Buy ? "buy" : "sell"},
      {"orderType", order.type == domain::OrderType::Limit ? "limit" : "market"},
      {"clientOid", clientOid(order.id)},
      {"reduceOnly", order.reduce_only ? "YES" : "NO"},
  };
  if (order.type == domain::OrderType::Limit) {
    body["price"] = formatDecimal(order.price, instrument.price_precision);
    body["force"] = "gtc";
  }
  return body;
}

json buildCancelOrder(const domain::Order& order,
                      const std::string& product_type,
                      const std::string& margin_coin) {
  json body = {
      {"symbol", order.symbol},
      {"productType", product_type},
      {"marginCoin", margin_coin},
  };
  if (!order.exchange_id.empty()) {
    body["orderId"] = order.exchange_id;
  } else {
    body["clientOid"] = clientOid(order.id);
  }
  return body;
}

OrderAck parseOrderAck(const json& data) {
  OrderAck ack;
  ack.exchange_id = strField(data, "orderId");
  ack.client_id = parseClientOid(strField(data, "clientOid"));
  return ack;
}

domain::OrderStatus parseOrderState(const std::string& state) {
  if (state == "partially_filled" || state == "partial-fill") {
    return domain::OrderStatus::PartiallyFilled;
  }
  if (state == "filled" || state == "full-fill") {
    return domain::OrderStatus::Filled;
  }
  if (state == "canceled" || state == "cancelled") {
    return domain::OrderStatus::Cancelled;
  }
  if (state == "rejected") {
    return domain::OrderStatus::Rejected;
  }
  // "live", "new", "init"
  return domain::OrderStatus::Acknowledged;
}

OrderStatusReport parseOrderReport(const json& order) {
  OrderStatusReport report;
  report.exchange_id = strField(order, "orderId");
  report.client_id = parseClientOid(strField(order, "clientOid"));
  report.symbol = strField(order, "symbol");
  report.side = parseSide(strField(order, "side"));
  report.type = strField(order, "orderType") == "market"
                    ? domain::OrderType::Market
                    : domain::OrderType::Limit;
  report.price = field(order, "price");
  report.quantity = field(order, "size");
  report.filled_quantity = field(order, "baseVolume");
  report.average_fill_price = field(order, "priceAvg");
  // Order detail calls it "state", the pending list "status".
  const std::string state = order.contains("state") ? strField(order, "state")
                                                    : strField(order, "status");
  report.status = parseOrderState(state);
  report.updated_ms = intField(order, "uTime");
  return report;
}

std::vector<OrderStatusReport> parseOpenOrders(const json& data) {
  std::vector<OrderStatusReport> out;
  if (!data.is_object()) {
    return out;
  }
  auto it = data.find("entrustedList");
  if (it == data.end() || !it->is_array()) {
    return out;  // null when nothing is open
  }
  for (const auto& order : *it) {
    out.push_back(parseOrderReport(order));
  }
  return out;
}

domain::OrderBookSnapshot parseMergeDepth(const std::string& symbol,
                                          const json& data) {
  domain::OrderBookSnapshot book;
  book.symbol = symbol;
  book.bids = parseLevels(data.value("bids", json::array()));
  book.asks = parseLevels(data.value("asks", json::array()));
  book.timestamp_ms = intField(data, "ts");
  book.version = static_cast<std::uint64_t>(book.timestamp_ms);
  return book;
}

std::vector<domain::Balance> parseAccounts(const json& data) {
  std::vector<domain::Balance> out;
  if (!data.is_array()) {
    return out;
  }
  for (const auto& account : data) {
    domain::Balance balance;
    balance.asset = strField(account, "marginCoin");
    balance.available = field(account, "available");
    balance.total = field(account, "accountEquity");
    out.push_back(balance);
  }
  return out;
}

std::vector<domain::Instrument> parseContracts(const json& data) {
  std::vector<domain::Instrument> out;
  if (!data.is_array()) {
    return out;
  }
  for (const auto& contract : data) {
    domain::Instrument instrument;
    instrument.symbol = strField(contract, "symbol");
    instrument.base_asset = strField(contract, "baseCoin");
    instrument.quote_asset = strField(contract, "quoteCoin");
    instrument.price_precision = static_cast<int>(intField(contract, "pricePlace"));
    instrument.quantity_precision =
        static_cast<int>(intField(contract, "volumePlace"));
    instrument.min_quantity = field(contract, "minTradeNum");
    if (contract.contains("minTradeUSDT")) {
      instrument.min_notional = field(contract, "minTradeUSDT");
    }
    // Tick = priceEndStep units of the last price place.
    double end_step = field(contract, "priceEndStep");
    if (end_step <= 0.0) {
      end_step = 1.0;
    }
    instrument.price_tick =
        end_step * std::pow(10.0, -instrument.price_precision);
    out.push_back(instrument);
  }
  return out;
}

std::int64_t parseServerTime(const json& data) {
  return intField(data, "serverTime");
}

std::string buildLogin(const std::string& api_key,
                       const std::string& passphrase,
                       const std::string& timestamp_sec,
                       const std::string& signature) {
  json login = {
      {"op", "login"},
      {"args",
       json::array({{{"apiKey", api_key},
                     {"passphrase", passphrase},
                     {"timestamp", timestamp_sec},
                     {"sign", signature}}})},
  };
  return login.dump();
}

std::string buildSubscription(const std::string& op,
                              const std::vector<StreamTopic>& topics) {
  json args = json::array();
  for (const auto& topic : topics) {
    json arg = {{"instType", topic.inst_type}, {"channel", topic.channel}};
    if (!topic.coin.empty()) {
      arg["coin"] = topic.coin;
    } else {
      arg["instId"] = topic.inst_id;
    }
    args.push_back(std::move(arg));
  }
  return json{{"op", op}, {"args", std::move(args)}}.dump();
}

namespace {

void parseBooks(const json& arg, const std::string& action, const json& data,
                StreamMessage& out) {
  const std::string symbol = strField(arg, "instId");
  const std::string channel = strField(arg, "channel");
  // books1/books5/books15 always push full snapshots.
  const bool snapshot = action == "snapshot" || channel != "books";

  for (const auto& entry : data) {
    // "ts" versions snapshots so they compare with REST merge-depth;
    // "seq"/"pseq" chain the updates.
    const std::int64_t ts = intField(entry, "ts");
    const auto seq = static_cast<std::uint64_t>(intField(entry, "seq"));

    if (snapshot) {
      BookSnapshotEvent event;
      event.book.symbol = symbol;
      event.book.bids = parseLevels(entry.value("bids", json::array()));
      event.book.asks = parseLevels(entry.value("asks", json::array()));
      event.book.version = static_cast<std::uint64_t>(ts);
      event.book.timestamp_ms = ts;
      event.stream_seq = seq;
      event.timestamp = ms_to_timestamp(ts);
      out.events.emplace_back(std::move(event));
    } else {
      BookUpdateEvent event;
      event.symbol = symbol;
      event.bids = parseLevels(entry.value("bids", json::array()));
      event.asks = parseLevels(entry.value("asks", json::array()));
      event.version = seq;
      event.previous_version =
          static_cast<std::uint64_t>(intField(entry, "pseq"));
      event.timestamp_ms = ts;
      event.timestamp = ms_to_timestamp(ts);
      out.events.emplace_back(std::move(event));
    }
  }
}

void parseTrades(const json& arg, const json& data, StreamMessage& out) {
  const std::string symbol = strField(arg, "instId");
  for (const auto& entry : data) {
    TradeEvent event;
    event.symbol = symbol;
    event.trade_id = strField(entry, "tradeId");
    event.price = field(entry, "price");
    event.quantity = field(entry, "size");
    event.aggressor = parseSide(strField(entry, "side"));
    event.timestamp_ms = intField(entry, "ts");
    event.timestamp = ms_to_timestamp(event.timestamp_ms);
    out.events.emplace_back(std::move(event));
  }
}

void parseTickers(const json& arg, const json& data, StreamMessage& out) {
  for (const auto& entry : data) {
    TickerEvent event;
    event.symbol = entry.contains("instId") ? strField(entry, "instId")
                                            : strField(arg, "instId");
    event.last_price = field(entry, "lastPr");
    event.best_bid = field(entry, "bidPr");
    event.best_ask = field(entry, "askPr");
    event.volume_24h = field(entry, "baseVolume");
    event.change_24h = field(entry, "change24h");
    event.timestamp_ms = intField(entry, "ts");
    event.timestamp = ms_to_timestamp(event.timestamp_ms);
    out.events.emplace_back(std::move(event));
  }
}

// One "orders" push can carry an acknowledgement, a fill (tradeId set) and a
// terminal state at once.
void parseOrders(const json& data, StreamMessage& out) {
  for (const auto& entry : data) {
    const domain::OrderId client_id = parseClientOid(strField(entry, "clientOid"));
    const std::string exchange_id = strField(entry, "orderId");
    const std::string symbol = strField(entry, "instId");
    const std::string status = strField(entry, "status");
    const std::int64_t ts = intField(entry, "uTime");

    OrderAckEvent ack;
    ack.client_id = client_id;
    ack.exchange_id = exchange_id;
    ack.symbol = symbol;
    ack.timestamp = ms_to_timestamp(ts);
    out.events.emplace_back(std::move(ack));

    const std::string trade_id = strField(entry, "tradeId");
    const double fill_qty = field(entry, "baseVolume");
    if (!trade_id.empty() && fill_qty > 0.0) {
      FillEvent fill;
      fill.client_id = client_id;
      fill.exchange_id = exchange_id;
      fill.fill_id = trade_id;
      fill.symbol = symbol;
      fill.side = parseSide(strField(entry, "side"));
      fill.price = field(entry, "fillPrice");
      fill.quantity = fill_qty;
      fill.fee = -field(entry, "fillFee");  // Negative on the wire when paid
      fill.timestamp_ms = intField(entry, "fillTime");
      fill.timestamp = ms_to_timestamp(fill.timestamp_ms);
      out.events.emplace_back(std::move(fill));
    }

    if (status == "canceled" || status == "cancelled") {
      CancelAckEvent cancel;
      cancel.client_id = client_id;
      cancel.exchange_id = exchange_id;
      cancel.symbol = symbol;
      cancel.cumulative_filled = field(entry, "accBaseVolume");
      cancel.reason = status;
      cancel.timestamp = ms_to_timestamp(ts);
      out.events.emplace_back(std::move(cancel));
    }
  }
}

void parseFills(const json& data, StreamMessage& out) {
  for (const auto& entry : data) {
    FillEvent fill;
    fill.client_id = parseClientOid(strField(entry, "clientOid"));
    fill.exchange_id = strField(entry, "orderId");
    fill.fill_id = strField(entry, "tradeId");
    fill.symbol = strField(entry, "symbol");
    fill.side = parseSide(strField(entry, "side"));
    fill.price = field(entry, "price");
    fill.quantity = field(entry, "baseVolume");
    double fee = 0.0;
    if (auto it = entry.find("feeDetail"); it != entry.end() && it->is_array()) {
      for (const auto& detail : *it) {
        fee += field(detail, "totalFee");
      }
    }
    fill.fee = -fee;
    fill.timestamp_ms = intField(entry, "cTime");
    fill.timestamp = ms_to_timestamp(fill.timestamp_ms);
    out.events.emplace_back(std::move(fill));
  }
}

void parseAccountPush(const json& data, StreamMessage& out) {
  for (const auto& entry : data) {
    BalanceEvent event;
    event.asset = strField(entry, "marginCoin");
    event.available = field(entry, "available");
    event.total = entry.contains("accountEquity") ? field(entry, "accountEquity")
                                                  : field(entry, "equity");
    out.events.emplace_back(std::move(event));
  }
}

}  // namespace

bool isLoginFailure(const std::string& code) {
  static const std::set<std::string> codes{"30005", "30011", "30012",
                                           "30013", "30014", "30015"};
  return codes.count(code) > 0;
}

StreamMessage parseStreamMessage(const std::string& text) {
  StreamMessage out;
  if (text == "pong") {
    out.kind = StreamMessage::Kind::Pong;
    return out;
  }

  json msg;
  try {
    msg = json::parse(text);
  } catch (const json::exception& e) {
    out.kind = StreamMessage::Kind::Error;
    out.message = std::string("unparseable frame: ") + e.what();
    return out;
  }
  if (!msg.is_object()) {
    return out;
  }

  const std::string event = strField(msg, "event");
  if (event == "login") {
    out.kind = strField(msg, "code") == "0" ? StreamMessage::Kind::LoginOk
                                            : StreamMessage::Kind::Error;
    out.code = strField(msg, "code");
    out.message = strField(msg, "msg");
    return out;
  }
  if (event == "subscribe") {
    out.kind = StreamMessage::Kind::Subscribed;
    out.channel = strField(msg.value("arg", json::object()), "channel");
    return out;
  }
  if (event == "error") {
    out.kind = StreamMessage::Kind::Error;
    out.code = strField(msg, "code");
    out.message = strField(msg, "msg");
    return out;
  }

  auto data_it = msg.find("data");
  if (data_it == msg.end() || !data_it->is_array()) {
    return out;
  }

  const json arg = msg.value("arg", json::object());
  out.channel = strField(arg, "channel");
  const std::string action = strField(msg, "action");
  out.kind = StreamMessage::Kind::Data;

  try {
    if (out.channel.rfind("books", 0) == 0) {
      parseBooks(arg, action, *data_it, out);
    } else if (out.channel == "trade") {
      parseTrades(arg, *data_it, out);
    } else if (out.channel == "ticker") {
      parseTickers(arg, *data_it, out);
    } else if (out.channel == "orders") {
      parseOrders(*data_it, out);
    } else if (out.channel == "fill") {
      parseFills(*data_it, out);
    } else if (out.channel == "account") {
      parseAccountPush(*data_it, out);
    } else {
      out.kind = StreamMessage::Kind::Ignored;
    }
  } catch (const json::exception& e) {
    out.events.clear();
    out.kind = StreamMessage::Kind::Error;
    out.message = std::string("bad ") + out.channel + " payload: " + e.what();
  }
  return out;
}

}  // namespace bitget
}  // namespace bgcore
