#pragma once

#include "bgcore/domain/instrument.hpp"
#include "bgcore/domain/risk_limits.hpp"
#include "bgcore/exchange/backoff.hpp"
#include "bgcore/exchange/bitget_transport.hpp"
#include "bgcore/exchange/rate_limiter.hpp"
#include "bgcore/exchange/simulated_transport.hpp"
#include "bgcore/exchange/stream_channel.hpp"
#include "bgcore/session/exchange_session.hpp"
#include "bgcore/strategy/book_imbalance_strategy.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bgcore {

enum class TradingMode {
  Live,   // BitgetTransport for everything
  Paper,  // Live public market data, SimulatedTransport order entry
};

struct ExchangeConfig {
  TradingMode mode{TradingMode::Paper};
  std::string product_type{"USDT-FUTURES"};
  std::string margin_coin{"USDT"};
  std::string rest_base_url{"https://api.bitget.com"};
  std::string public_ws_url{"wss://ws.bitget.com/v2/ws/public"};
  std::string private_ws_url{"wss://ws.bitget.com/v2/ws/private"};
  long rest_timeout_ms{5000};
  long rest_connect_timeout_ms{3000};
  int query_retries{3};
  int book_depth{15};
  std::int64_t clock_skew_tolerance_ms{5000};
  bool load_instruments{true};  // Fetch contract metadata at startup
  HeartbeatConfig heartbeat;
};

struct StrategyConfig {
  std::string name{"hold"};  // "hold" or "book_imbalance"
  BookImbalanceConfig book_imbalance;
};

struct EngineLoopConfig {
  std::int64_t decision_interval_ms{1000};
  std::size_t stream_queue_capacity{4096};
  std::int64_t shutdown_grace_ms{3000};
  std::int64_t pending_timeout_ms{10000};
  std::int64_t order_ttl_ms{60000};  // Working limit orders older are cancelled, 0 = never
};

struct IpcConfig {
  bool enabled{false};
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

struct PersistenceConfig {
  std::string snapshot_path;  // Empty disables persistence
  std::int64_t save_interval_ms{60000};
};

// -----------------------------------------------------------------------------
// EngineConfig: everything the process reads at startup
// -----------------------------------------------------------------------------
//
// @brief  Plain aggregate filled from one JSON file plus the
//         BITGET_API_KEY / BITGET_API_SECRET / BITGET_API_PASSPHRASE
//         environment variables.
//
// @details
// Every section and field is optional; absent values keep the defaults
// above. risk.allowed_instruments defaults to the configured instruments.
// Malformed JSON, wrong types and out-of-range values throw ConfigError.
// Live mode additionally requires complete credentials.
// -----------------------------------------------------------------------------
struct EngineConfig {
  Credentials credentials;
  ExchangeConfig exchange;
  std::vector<domain::Instrument> instruments;
  domain::RiskLimits risk;
  RateLimitConfig rate_limits;
  BackoffConfig reconnect;
  StrategyConfig strategy;
  EngineLoopConfig engine;
  IpcConfig ipc;
  PersistenceConfig persistence;
  SimulatedTransportConfig paper;

  std::vector<std::string> symbols() const;

  BitgetTransportConfig transportConfig() const;
};

// Returns the value of an environment variable, or nullopt.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> processEnv(const std::string& name);

EngineConfig parseConfig(const nlohmann::json& doc,
                         const EnvLookup& env = processEnv);

EngineConfig loadConfig(const std::string& path,
                        const EnvLookup& env = processEnv);

// Throws ConfigError on inconsistent values.
void validateConfig(const EngineConfig& config);

// "wss://host[:port]/path" → StreamEndpoint. Throws ConfigError.
StreamEndpoint parseWebsocketUrl(const std::string& url);

const char* toString(TradingMode mode);

}  // namespace bgcore
