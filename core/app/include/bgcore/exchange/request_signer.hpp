#pragma once

#include "bgcore/session/exchange_session.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bgcore {

// -----------------------------------------------------------------------------
// RequestSigner: Bitget API authentication
// -----------------------------------------------------------------------------
//
// @brief  Builds ACCESS-* headers for REST calls and the login payload
//         signature for the private websocket.
//
// @details
// Signature scheme (REST):
//   prehash = timestamp_ms + METHOD + requestPath[?query] + body
//   ACCESS-SIGN = base64(HMAC-SHA256(api_secret, prehash))
//
// Websocket login uses the same scheme with a seconds timestamp, METHOD
// "GET" and path "/user/verify".
//
// Timestamps come from ExchangeSession::exchangeNowMs(), i.e. the local clock
// corrected by the offset measured at startup. checkClockSkew() records that
// offset and throws AuthError when it exceeds the tolerance: Bitget refuses
// requests whose timestamp is more than 30s away from its own clock.
//
// Thread model:
//   Stateless apart from the session reference; all buffers are local, so
//   concurrent calls are safe.
// -----------------------------------------------------------------------------
class RequestSigner {
 public:
  explicit RequestSigner(ExchangeSession& session);

  // base64(HMAC-SHA256(secret, timestamp + method + request_path + body)).
  std::string sign(const std::string& timestamp, const std::string& method,
                   const std::string& request_path,
                   const std::string& body) const;

  // "Name: value" lines ready for curl_slist_append.
  std::vector<std::string> headers(const std::string& method,
                                   const std::string& request_path,
                                   const std::string& body) const;

  // Signature for the websocket login op at `timestamp_sec`.
  std::string loginSignature(const std::string& timestamp_sec) const;

  // Stores server_ms - local_ms in the session. Throws AuthError if the
  // absolute offset is larger than tolerance_ms.
  void checkClockSkew(std::int64_t server_ms, std::int64_t local_ms,
                      std::int64_t tolerance_ms);

  const ExchangeSession& session() const { return session_; }

 private:
  ExchangeSession& session_;
};

// Raw HMAC-SHA256 of `message` keyed with `key`, base64 encoded on one line.
std::string hmacSha256Base64(const std::string& key, const std::string& message);

}  // namespace bgcore
