#pragma once

#include "bgcore/domain/balance.hpp"
#include "bgcore/domain/instrument.hpp"
#include "bgcore/domain/order.hpp"
#include "bgcore/domain/order_book.hpp"
#include "bgcore/events/event.hpp"
#include "bgcore/events/exchange_events.hpp"
#include "bgcore/exchange/i_exchange_transport.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace bgcore {
namespace bitget {

// -----------------------------------------------------------------------------
// Bitget v2 wire codec
// -----------------------------------------------------------------------------
//
// @brief  Pure functions between domain types and Bitget's JSON: request
//         bodies, REST envelopes and data payloads, websocket ops and pushes.
//
// @details
// Nothing here performs I/O, so the whole wire format is unit-testable from
// captured payloads. Bitget encodes most numbers as strings; the parsers
// accept either form.
// -----------------------------------------------------------------------------

inline constexpr const char* kSuccessCode = "00000";
inline constexpr const char* kClientOidPrefix = "bgc";

// "bgc<id>"
std::string clientOid(domain::OrderId id);

// Inverse of clientOid(); 0 for anything that is not one of ours.
domain::OrderId parseClientOid(const std::string& oid);

// Fixed-point decimal string with `precision` places.
std::string formatDecimal(double value, int precision);

// "?k1=v1&k2=v2" (empty string when no params).
std::string buildQuery(const std::vector<std::pair<std::string, std::string>>& params);

// ---------------------------------------------------------------------------
// Envelope and error classification
// ---------------------------------------------------------------------------

enum class ErrorClass {
  None,
  Retryable,
  Auth,
  NotFound,
  Rejection,
};

ErrorClass classifyError(long http_status, const std::string& code);

// -------------------------------------------------------------------------
// unwrapEnvelope(http_status, body)
// -------------------------------------------------------------------------
// Parses {code, msg, data}. Returns data on code "00000". Otherwise throws
// by class: TransientNetworkError, AuthError or ExchangeRejection (NotFound
// is an ExchangeRejection too; callers that expect it check isNotFound()).
// An unparseable body is a TransientNetworkError: the outcome is unknown.
// -------------------------------------------------------------------------
nlohmann::json unwrapEnvelope(long http_status, const std::string& body);

bool isNotFound(const std::string& code);

// ---------------------------------------------------------------------------
// REST request bodies
// ---------------------------------------------------------------------------

nlohmann::json buildPlaceOrder(const domain::Order& order,
                               const domain::Instrument& instrument,
                               const std::string& product_type,
                               const std::string& margin_coin);

nlohmann::json buildCancelOrder(const domain::Order& order,
                                const std::string& product_type,
                                const std::string& margin_coin);

// ---------------------------------------------------------------------------
// REST data payloads
// ---------------------------------------------------------------------------

OrderAck parseOrderAck(const nlohmann::json& data);
OrderStatusReport parseOrderReport(const nlohmann::json& order);
std::vector<OrderStatusReport> parseOpenOrders(const nlohmann::json& data);
domain::OrderBookSnapshot parseMergeDepth(const std::string& symbol,
                                          const nlohmann::json& data);
std::vector<domain::Balance> parseAccounts(const nlohmann::json& data);
std::vector<domain::Instrument> parseContracts(const nlohmann::json& data);
std::int64_t parseServerTime(const nlohmann::json& data);

domain::OrderStatus parseOrderState(const std::string& state);

// ---------------------------------------------------------------------------
// Websocket
// ---------------------------------------------------------------------------

struct StreamTopic {
  std::string inst_type;  // "USDT-FUTURES"
  std::string channel;    // books, trade, ticker, orders, fill, account
  std::string inst_id;    // Symbol, or "default" on private channels
  std::string coin;       // Only for "account"
};

std::string buildLogin(const std::string& api_key,
                       const std::string& passphrase,
                       const std::string& timestamp_sec,
                       const std::string& signature);

// op is "subscribe" or "unsubscribe".
std::string buildSubscription(const std::string& op,
                              const std::vector<StreamTopic>& topics);

struct StreamMessage {
  enum class Kind {
    Data,
    Pong,
    LoginOk,
    Subscribed,
    Error,
    Ignored,
  } kind{Kind::Ignored};
  std::vector<Event> events;
  std::string channel;
  std::string code;
  std::string message;
};

// Websocket error codes that mean the login itself was refused (bad key,
// passphrase, timestamp or signature).
bool isLoginFailure(const std::string& code);

// Parses one websocket text frame. Malformed JSON yields Kind::Error.
StreamMessage parseStreamMessage(const std::string& text);

}  // namespace bitget
}  // namespace bgcore
