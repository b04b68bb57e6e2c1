#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace bgcore {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception types raised by the transport, cache and configuration
//         layers. All derive from std::runtime_error so callers that only
//         log can catch std::exception.
//
// @details
// Recovery policy per type:
//   TransientNetworkError: retried with backoff by the caller; an order whose
//     submission failed this way stays Pending until reconciliation
//     resolves it.
//   AuthError: fatal, the coordinator halts new submissions.
//   ExchangeRejection: terminal for one order only (ledger → Rejected).
//   SequenceGapError: cache invalidation + resync, never fatal.
//   ConfigError: fatal at startup.
//
// Risk rejections are not exceptions; the RiskGate returns a RiskDecision.
// -----------------------------------------------------------------------------
class TransientNetworkError : public std::runtime_error {
 public:
  explicit TransientNetworkError(const std::string& what)
      : std::runtime_error(what) {}
};

// Token bucket could not grant a request within its bounded wait. The request
// was never sent.
class RateLimitExceeded : public TransientNetworkError {
 public:
  explicit RateLimitExceeded(const std::string& what)
      : TransientNetworkError(what) {}
};

class AuthError : public std::runtime_error {
 public:
  explicit AuthError(const std::string& what) : std::runtime_error(what) {}
};

class ExchangeRejection : public std::runtime_error {
 public:
  ExchangeRejection(std::string code, const std::string& message)
      : std::runtime_error("exchange rejected request: code=" + code + " " +
                           message),
        code_(std::move(code)),
        message_(message) {}

  const std::string& code() const { return code_; }
  const std::string& message() const { return message_; }

 private:
  std::string code_;
  std::string message_;
};

class SequenceGapError : public std::runtime_error {
 public:
  explicit SequenceGapError(const std::string& what)
      : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace bgcore
