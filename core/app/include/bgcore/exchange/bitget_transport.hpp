#pragma once

#include "bgcore/exchange/backoff.hpp"
#include "bgcore/exchange/bitget_codec.hpp"
#include "bgcore/exchange/i_exchange_transport.hpp"
#include "bgcore/exchange/rate_limiter.hpp"
#include "bgcore/exchange/request_signer.hpp"
#include "bgcore/exchange/rest_client.hpp"
#include "bgcore/exchange/stream_channel.hpp"
#include "bgcore/session/exchange_session.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace bgcore {

struct BitgetTransportConfig {
  std::string rest_base_url{"https://api.bitget.com"};
  long rest_timeout_ms{5000};
  long rest_connect_timeout_ms{3000};
  int query_retries{3};  // GET only; order entry is never retried blindly
  StreamEndpoint public_stream{"ws.bitget.com", "443", "/v2/ws/public"};
  StreamEndpoint private_stream{"ws.bitget.com", "443", "/v2/ws/private"};
  std::vector<std::string> symbols;  // Instruments to stream
  int book_depth{15};                // 1, 5, 15 (snapshots) or 0 for "books"
  std::int64_t clock_skew_tolerance_ms{5000};
  RateLimitConfig rate_limits;
  BackoffConfig reconnect;
  HeartbeatConfig heartbeat;
};

// -----------------------------------------------------------------------------
// BitgetTransport: IExchangeTransport for Bitget v2 USDT-M futures
// -----------------------------------------------------------------------------
//
// @brief  Signed REST order entry and queries plus two streaming channels:
//         public (books, trade, ticker per symbol) and private (orders, fill,
//         account after login).
//
// @details
// Every REST call first takes a token from the RateLimiter bucket of its
// endpoint class, then is signed and sent. Responses are unwrapped by the
// codec, which maps exchange codes onto the error taxonomy. Idempotent GETs
// are retried on TransientNetworkError with backoff; POSTs are not (a lost
// place-order response is settled by reconciliation via clientOid).
//
// syncClock() measures the offset to /api/v2/public/time and throws
// AuthError when it exceeds the configured tolerance.
//
// requestResync(symbol) re-subscribes that symbol's book channel, which makes
// Bitget push a fresh snapshot.
//
// Thread model:
//   REST methods may be called from any thread (the client serializes).
//   Stream frames are decoded on each channel's thread and pushed to the
//   sink in arrival order.
// -----------------------------------------------------------------------------
class BitgetTransport final : public IExchangeTransport {
 public:
  BitgetTransport(ExchangeSession& session, BitgetTransportConfig config);
  ~BitgetTransport() override;

  OrderAck submitOrder(const domain::Order& order) override;
  CancelAck cancelOrder(const domain::Order& order) override;
  std::optional<OrderStatusReport> queryOrder(const domain::Order& order) override;
  std::vector<OrderStatusReport> fetchOpenOrders() override;
  domain::OrderBookSnapshot fetchBook(const std::string& symbol) override;
  std::vector<domain::Balance> fetchBalances() override;
  std::vector<domain::Instrument> fetchInstruments() override;

  void startStream(EventSink sink) override;
  void stopStream() override;
  void requestResync(const std::string& symbol) override;

  // Measures and stores the clock offset. Throws AuthError beyond tolerance.
  void syncClock();

 private:
  nlohmann::json request(EndpointClass endpoint, const std::string& method,
                         const std::string& path, const std::string& query,
                         const nlohmann::json* body, bool is_private);
  nlohmann::json get(EndpointClass endpoint, const std::string& path,
                     const std::string& query, bool is_private);

  std::vector<bitget::StreamTopic> publicTopics() const;
  std::vector<bitget::StreamTopic> privateTopics() const;
  bitget::StreamTopic bookTopic(const std::string& symbol) const;

  InboundKind handleFrame(const std::string& text);

  ExchangeSession& session_;
  const BitgetTransportConfig config_;
  RestClient rest_;
  RequestSigner signer_;
  RateLimiter limiter_;

  std::mutex stream_mutex_;  // Guards sink_ and the channels
  EventSink sink_;
  std::unique_ptr<StreamChannel> public_channel_;
  std::unique_ptr<StreamChannel> private_channel_;
};

}  // namespace bgcore
