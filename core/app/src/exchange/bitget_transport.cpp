#include "bgcore/exchange/bitget_transport.hpp"

#include "bgcore/domain/errors.hpp"

#include <iostream>
#include <thread>

namespace bgcore {

using json = nlohmann::json;

namespace {

constexpr const char* kPlaceOrderPath = "/api/v2/mix/order/place-order";
constexpr const char* kCancelOrderPath = "/api/v2/mix/order/cancel-order";
constexpr const char* kOrderDetailPath = "/api/v2/mix/order/detail";
constexpr const char* kOrdersPendingPath = "/api/v2/mix/order/orders-pending";
constexpr const char* kMergeDepthPath = "/api/v2/mix/market/merge-depth";
constexpr const char* kContractsPath = "/api/v2/mix/market/contracts";
constexpr const char* kAccountsPath = "/api/v2/mix/account/accounts";
constexpr const char* kServerTimePath = "/api/v2/public/time";

constexpr std::size_t kOpenOrdersPageSize = 100;

}  // namespace

BitgetTransport::BitgetTransport(ExchangeSession& session,
                                 BitgetTransportConfig config)
    : session_(session),
      config_(std::move(config)),
      rest_(config_.rest_base_url, config_.rest_timeout_ms,
            config_.rest_connect_timeout_ms),
      signer_(session),
      limiter_(config_.rate_limits, session.clock()) {}

BitgetTransport::~BitgetTransport() { stopStream(); }

// -----------------------------------------------------------------------------
// request(): rate limit, sign, send, unwrap
// -----------------------------------------------------------------------------
json BitgetTransport::request(EndpointClass endpoint, const std::string& method,
                              const std::string& path, const std::string& query,
                              const json* body, bool is_private) {
  limiter_.acquire(endpoint);

  const std::string payload = body ? body->dump() : std::string{};
  const std::string request_path = path + query;

  std::vector<std::string> headers;
  if (is_private) {
    headers = signer_.headers(method, request_path, payload);
  } else {
    headers = {"locale: en-US", "Content-Type: application/json"};
  }

  const HttpResponse response =
      rest_.perform(method, request_path, payload, headers);
  return bitget::unwrapEnvelope(response.status, response.body);
}

json BitgetTransport::get(EndpointClass endpoint, const std::string& path,
                          const std::string& query, bool is_private) {
  ExponentialBackoff backoff(BackoffConfig{100, 1000, 0.2});
  for (int attempt = 1;; ++attempt) {
    try {
      return request(endpoint, "GET", path, query, nullptr, is_private);
    } catch (const RateLimitExceeded&) {
      throw;
    } catch (const TransientNetworkError& e) {
      if (attempt >= config_.query_retries) {
        throw;
      }
      const auto delay = backoff.nextDelay();
      std::cout << "[BitgetTransport] GET " << path << " retry " << attempt
                << "/" << config_.query_retries << " in " << delay.count()
                << " ms (" << e.what() << ")" << std::endl;
      std::this_thread::sleep_for(delay);
    }
  }
}

void BitgetTransport::syncClock() {
  const std::int64_t before = session_.clock().now_ms();
  const json data = get(EndpointClass::Query, kServerTimePath, "", false);
  const std::int64_t after = session_.clock().now_ms();
  // Assume the server stamped the response halfway through the round trip.
  signer_.checkClockSkew(bitget::parseServerTime(data), (before + after) / 2,
                         config_.clock_skew_tolerance_ms);
}

OrderAck BitgetTransport::submitOrder(const domain::Order& order) {
  auto instrument = session_.instrument(order.symbol);
  if (!instrument) {
    throw ExchangeRejection("unknown-instrument",
                            "no instrument metadata for " + order.symbol);
  }
  const json body = bitget::buildPlaceOrder(
      order, *instrument, session_.productType(), session_.marginCoin());
  const json data = request(EndpointClass::PlaceOrder, "POST", kPlaceOrderPath,
                            "", &body, true);

  OrderAck ack = bitget::parseOrderAck(data);
  if (ack.client_id == 0) {
    ack.client_id = order.id;
  }
  return ack;
}

CancelAck BitgetTransport::cancelOrder(const domain::Order& order) {
  const json body = bitget::buildCancelOrder(order, session_.productType(),
                                             session_.marginCoin());
  const json data = request(EndpointClass::CancelOrder, "POST",
                            kCancelOrderPath, "", &body, true);
  const OrderAck parsed = bitget::parseOrderAck(data);
  return CancelAck{order.id, parsed.exchange_id.empty() ? order.exchange_id
                                                        : parsed.exchange_id};
}

std::optional<OrderStatusReport> BitgetTransport::queryOrder(
    const domain::Order& order) {
  std::vector<std::pair<std::string, std::string>> params{
      {"symbol", order.symbol}, {"productType", session_.productType()}};
  if (!order.exchange_id.empty()) {
    params.emplace_back("orderId", order.exchange_id);
  } else {
    params.emplace_back("clientOid", bitget::clientOid(order.id));
  }

  try {
    const json data = get(EndpointClass::Query, kOrderDetailPath,
                          bitget::buildQuery(params), true);
    if (data.is_null()) {
      return std::nullopt;
    }
    OrderStatusReport report = bitget::parseOrderReport(data);
    if (report.client_id == 0) {
      report.client_id = order.id;
    }
    return report;
  } catch (const ExchangeRejection& e) {
    if (bitget::isNotFound(e.code())) {
      return std::nullopt;
    }
    throw;
  }
}

std::vector<OrderStatusReport> BitgetTransport::fetchOpenOrders() {
  std::vector<OrderStatusReport> all;
  std::string end_id;
  while (true) {
    std::vector<std::pair<std::string, std::string>> params{
        {"productType", session_.productType()},
        {"limit", std::to_string(kOpenOrdersPageSize)}};
    if (!end_id.empty()) {
      params.emplace_back("idLessThan", end_id);
    }
    const json data = get(EndpointClass::Query, kOrdersPendingPath,
                          bitget::buildQuery(params), true);
    auto page = bitget::parseOpenOrders(data);
    const std::size_t count = page.size();
    all.insert(all.end(), page.begin(), page.end());

    if (count < kOpenOrdersPageSize || !data.is_object()) {
      break;
    }
    end_id = data.value("endId", std::string{});
    if (end_id.empty()) {
      break;
    }
  }
  return all;
}

domain::OrderBookSnapshot BitgetTransport::fetchBook(const std::string& symbol) {
  const std::string query = bitget::buildQuery(
      {{"symbol", symbol},
       {"productType", session_.productType()},
       {"limit", std::to_string(config_.book_depth > 0 ? config_.book_depth : 50)}});
  const json data = get(EndpointClass::MarketData, kMergeDepthPath, query, false);
  return bitget::parseMergeDepth(symbol, data);
}

std::vector<domain::Balance> BitgetTransport::fetchBalances() {
  const json data =
      get(EndpointClass::Query, kAccountsPath,
          bitget::buildQuery({{"productType", session_.productType()}}), true);
  return bitget::parseAccounts(data);
}

std::vector<domain::Instrument> BitgetTransport::fetchInstruments() {
  const json data =
      get(EndpointClass::MarketData, kContractsPath,
          bitget::buildQuery({{"productType", session_.productType()}}), false);
  return bitget::parseContracts(data);
}

// -----------------------------------------------------------------------------
// Streaming
// -----------------------------------------------------------------------------

bitget::StreamTopic BitgetTransport::bookTopic(const std::string& symbol) const {
  const std::string channel =
      config_.book_depth > 0 ? "books" + std::to_string(config_.book_depth)
                             : "books";
  return {session_.productType(), channel, symbol, ""};
}

std::vector<bitget::StreamTopic> BitgetTransport::publicTopics() const {
  std::vector<bitget::StreamTopic> topics;
  for (const auto& symbol : config_.symbols) {
    topics.push_back(bookTopic(symbol));
    topics.push_back({session_.productType(), "trade", symbol, ""});
    topics.push_back({session_.productType(), "ticker", symbol, ""});
  }
  return topics;
}

std::vector<bitget::StreamTopic> BitgetTransport::privateTopics() const {
  return {
      {session_.productType(), "orders", "default", ""},
      {session_.productType(), "fill", "default", ""},
      {session_.productType(), "account", "", "default"},
  };
}

InboundKind BitgetTransport::handleFrame(const std::string& text) {
  bitget::StreamMessage msg = bitget::parseStreamMessage(text);
  switch (msg.kind) {
    case bitget::StreamMessage::Kind::Data:
      for (auto& event : msg.events) {
        sink_(std::move(event));
      }
      return InboundKind::Data;
    case bitget::StreamMessage::Kind::LoginOk:
      return InboundKind::LoginAccepted;
    case bitget::StreamMessage::Kind::Error:
      std::cerr << "[BitgetTransport] Stream error " << msg.code << ": "
                << msg.message << std::endl;
      if (bitget::isLoginFailure(msg.code)) {
        return InboundKind::LoginRejected;
      }
      return InboundKind::Other;
    case bitget::StreamMessage::Kind::Pong:
    case bitget::StreamMessage::Kind::Subscribed:
    case bitget::StreamMessage::Kind::Ignored:
      break;
  }
  return InboundKind::Other;
}

void BitgetTransport::startStream(EventSink sink) {
  std::lock_guard lock(stream_mutex_);
  if (public_channel_ || private_channel_) {
    return;
  }
  sink_ = std::move(sink);

  StreamChannel::Callbacks public_callbacks;
  public_callbacks.subscribe_message = [this] {
    return bitget::buildSubscription("subscribe", publicTopics());
  };
  public_callbacks.on_message = [this](const std::string& text) {
    return handleFrame(text);
  };
  public_channel_ = std::make_unique<StreamChannel>(
      "public", config_.public_stream, config_.reconnect, config_.heartbeat,
      session_.clock(), std::move(public_callbacks), sink_);
  public_channel_->start();

  if (!session_.credentials().complete()) {
    std::cout << "[BitgetTransport] No credentials, private stream disabled"
              << std::endl;
    return;
  }

  StreamChannel::Callbacks private_callbacks;
  private_callbacks.login_message = [this] {
    const std::string ts = std::to_string(session_.exchangeNowMs() / 1000);
    return bitget::buildLogin(session_.credentials().api_key,
                              session_.credentials().passphrase, ts,
                              signer_.loginSignature(ts));
  };
  private_callbacks.subscribe_message = [this] {
    return bitget::buildSubscription("subscribe", privateTopics());
  };
  private_callbacks.on_message = [this](const std::string& text) {
    return handleFrame(text);
  };
  private_channel_ = std::make_unique<StreamChannel>(
      "private", config_.private_stream, config_.reconnect, config_.heartbeat,
      session_.clock(), std::move(private_callbacks), sink_);
  private_channel_->start();
}

void BitgetTransport::stopStream() {
  std::lock_guard lock(stream_mutex_);
  if (public_channel_) {
    public_channel_->stop();
    public_channel_.reset();
  }
  if (private_channel_) {
    private_channel_->stop();
    private_channel_.reset();
  }
}

void BitgetTransport::requestResync(const std::string& symbol) {
  std::lock_guard lock(stream_mutex_);
  if (!public_channel_) {
    return;
  }
  const std::vector<bitget::StreamTopic> topics{bookTopic(symbol)};
  public_channel_->send(bitget::buildSubscription("unsubscribe", topics));
  public_channel_->send(bitget::buildSubscription("subscribe", topics));
  std::cout << "[BitgetTransport] Re-subscribed book for " << symbol
            << std::endl;
}

}  // namespace bgcore
