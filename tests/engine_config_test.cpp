// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for the configuration layer (parseConfig / loadConfig /
// validateConfig / parseWebsocketUrl).
//
// Validates:
//   - Defaults when sections are absent; risk allow-list defaults to the
//     configured instruments
//   - Every section maps onto its struct
//   - Credentials come from the environment lookup only
//   - Wrong types, bad values, live mode without credentials → ConfigError
//   - loadConfig() reads a file and reports unreadable / invalid files
// =============================================================================

#include "bgcore/domain/errors.hpp"
#include "bgcore/engine/engine_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <map>
#include <optional>
#include <string>

using json = nlohmann::json;

namespace {

bgcore::EnvLookup fakeEnv(std::map<std::string, std::string> values) {
  return [values](const std::string& name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

const bgcore::EnvLookup kNoEnv = fakeEnv({});

json minimalDoc() {
  return json::parse(R"({"instruments":[{"symbol":"BTCUSDT"}]})");
}

}  // namespace

TEST(EngineConfigTest, MinimalDocumentGetsDefaults) {
  const auto config = bgcore::parseConfig(minimalDoc(), kNoEnv);

  EXPECT_EQ(config.exchange.mode, bgcore::TradingMode::Paper);
  EXPECT_EQ(config.exchange.product_type, "USDT-FUTURES");
  EXPECT_EQ(config.exchange.margin_coin, "USDT");
  ASSERT_EQ(config.instruments.size(), 1u);
  EXPECT_EQ(config.instruments[0].quote_asset, "USDT");
  EXPECT_EQ(config.instruments[0].quantity_precision, 3);

  EXPECT_EQ(config.risk.allowed_instruments,
            (std::set<std::string>{"BTCUSDT"}));
  EXPECT_DOUBLE_EQ(config.risk.max_position_per_instrument, 1.0);
  EXPECT_EQ(config.strategy.name, "hold");
  EXPECT_FALSE(config.ipc.enabled);
  EXPECT_TRUE(config.persistence.snapshot_path.empty());
  EXPECT_EQ(config.paper.instruments.size(), 1u);
  EXPECT_FALSE(config.credentials.complete());
}

TEST(EngineConfigTest, ReadsEverySection) {
  const auto doc = json::parse(R"({
    "exchange": {"mode": "paper", "book_depth": 5, "rest_timeout_ms": 2500,
                 "ping_interval_ms": 20000},
    "instruments": [
      {"symbol": "BTCUSDT", "base_asset": "BTC", "price_precision": 1,
       "quantity_precision": 3, "min_quantity": 0.001, "price_tick": 0.5},
      {"symbol": "ETHUSDT", "base_asset": "ETH"}
    ],
    "risk": {"allowed_instruments": ["ETHUSDT"], "max_order_notional": 250,
             "max_open_orders": 2, "min_order_interval_ms": 500,
             "max_drawdown": -100},
    "rate_limits": {"place_order": {"capacity": 5, "refill_per_sec": 5},
                    "max_wait_ms": 800},
    "reconnect": {"base_ms": 250, "cap_ms": 8000, "jitter": 0.1},
    "strategy": {"name": "book_imbalance", "confidence_threshold": 7,
                 "max_position_percent": 2.5},
    "engine": {"decision_interval_ms": 500, "pending_timeout_ms": 4000,
               "order_ttl_ms": 15000},
    "ipc": {"enabled": true, "cmd_endpoint": "tcp://127.0.0.1:6000"},
    "persistence": {"snapshot_path": "/tmp/ledger.json",
                    "save_interval_ms": 1000},
    "paper": {"initial_balance": 5000, "fee_rate": 0.0002}
  })");
  const auto config = bgcore::parseConfig(doc, kNoEnv);

  EXPECT_EQ(config.exchange.book_depth, 5);
  EXPECT_EQ(config.exchange.rest_timeout_ms, 2500);
  EXPECT_EQ(config.exchange.heartbeat.ping_interval_ms, 20000);
  ASSERT_EQ(config.instruments.size(), 2u);
  EXPECT_DOUBLE_EQ(config.instruments[0].price_tick, 0.5);
  EXPECT_EQ(config.symbols(), (std::vector<std::string>{"BTCUSDT", "ETHUSDT"}));

  EXPECT_EQ(config.risk.allowed_instruments, (std::set<std::string>{"ETHUSDT"}));
  EXPECT_DOUBLE_EQ(config.risk.max_order_notional, 250.0);
  EXPECT_EQ(config.risk.max_open_orders, 2u);
  EXPECT_EQ(config.risk.min_order_interval_ms, 500);
  EXPECT_DOUBLE_EQ(config.risk.max_drawdown, -100.0);

  EXPECT_DOUBLE_EQ(config.rate_limits.place_order.capacity, 5.0);
  EXPECT_DOUBLE_EQ(config.rate_limits.query.capacity, 20.0);
  EXPECT_EQ(config.rate_limits.max_wait_ms, 800);
  EXPECT_EQ(config.reconnect.base_ms, 250);

  EXPECT_EQ(config.strategy.name, "book_imbalance");
  EXPECT_EQ(config.strategy.book_imbalance.confidence_threshold, 7);
  EXPECT_DOUBLE_EQ(config.strategy.book_imbalance.max_position_percent, 2.5);

  EXPECT_EQ(config.engine.decision_interval_ms, 500);
  EXPECT_EQ(config.engine.pending_timeout_ms, 4000);
  EXPECT_EQ(config.engine.order_ttl_ms, 15000);
  EXPECT_TRUE(config.ipc.enabled);
  EXPECT_EQ(config.ipc.cmd_endpoint, "tcp://127.0.0.1:6000");
  EXPECT_EQ(config.persistence.snapshot_path, "/tmp/ledger.json");
  EXPECT_DOUBLE_EQ(config.paper.initial_balance, 5000.0);

  const auto transport = config.transportConfig();
  EXPECT_EQ(transport.public_stream.host, "ws.bitget.com");
  EXPECT_EQ(transport.book_depth, 5);
  EXPECT_EQ(transport.symbols.size(), 2u);
}

TEST(EngineConfigTest, CredentialsComeFromEnvironment) {
  auto doc = minimalDoc();
  doc["exchange"]["mode"] = "live";
  const auto env = fakeEnv({{"BITGET_API_KEY", "k"},
                            {"BITGET_API_SECRET", "s"},
                            {"BITGET_API_PASSPHRASE", "p"}});

  const auto config = bgcore::parseConfig(doc, env);
  EXPECT_EQ(config.exchange.mode, bgcore::TradingMode::Live);
  EXPECT_EQ(config.credentials.api_key, "k");
  EXPECT_EQ(config.credentials.api_secret, "s");
  EXPECT_EQ(config.credentials.passphrase, "p");
}

// -----------------------------------------------------------------------------
// Live trading without a complete key set must never start.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, LiveModeWithoutCredentialsIsRejected) {
  auto doc = minimalDoc();
  doc["exchange"]["mode"] = "live";
  EXPECT_THROW(bgcore::parseConfig(doc, fakeEnv({{"BITGET_API_KEY", "k"}})),
               bgcore::ConfigError);
}

TEST(EngineConfigTest, InvalidDocumentsAreRejected) {
  EXPECT_THROW(bgcore::parseConfig(json::array(), kNoEnv), bgcore::ConfigError);
  EXPECT_THROW(bgcore::parseConfig(json::object(), kNoEnv), bgcore::ConfigError);

  auto bad_type = minimalDoc();
  bad_type["risk"]["max_order_notional"] = "lots";
  EXPECT_THROW(bgcore::parseConfig(bad_type, kNoEnv), bgcore::ConfigError);

  auto bad_mode = minimalDoc();
  bad_mode["exchange"]["mode"] = "demo";
  EXPECT_THROW(bgcore::parseConfig(bad_mode, kNoEnv), bgcore::ConfigError);

  auto bad_section = minimalDoc();
  bad_section["risk"] = 5;
  EXPECT_THROW(bgcore::parseConfig(bad_section, kNoEnv), bgcore::ConfigError);

  auto no_symbol = json::parse(R"({"instruments":[{"base_asset":"BTC"}]})");
  EXPECT_THROW(bgcore::parseConfig(no_symbol, kNoEnv), bgcore::ConfigError);
}

TEST(EngineConfigTest, OutOfRangeValuesAreRejected) {
  auto positive_drawdown = minimalDoc();
  positive_drawdown["risk"]["max_drawdown"] = 10;
  EXPECT_THROW(bgcore::parseConfig(positive_drawdown, kNoEnv),
               bgcore::ConfigError);

  auto zero_orders = minimalDoc();
  zero_orders["risk"]["max_open_orders"] = 0;
  EXPECT_THROW(bgcore::parseConfig(zero_orders, kNoEnv), bgcore::ConfigError);

  auto bad_backoff = minimalDoc();
  bad_backoff["reconnect"]["base_ms"] = 5000;
  bad_backoff["reconnect"]["cap_ms"] = 1000;
  EXPECT_THROW(bgcore::parseConfig(bad_backoff, kNoEnv), bgcore::ConfigError);

  auto bad_bucket = minimalDoc();
  bad_bucket["rate_limits"]["query"]["refill_per_sec"] = 0;
  EXPECT_THROW(bgcore::parseConfig(bad_bucket, kNoEnv), bgcore::ConfigError);

  auto bad_strategy = minimalDoc();
  bad_strategy["strategy"]["name"] = "grid";
  EXPECT_THROW(bgcore::parseConfig(bad_strategy, kNoEnv), bgcore::ConfigError);

  auto negative_ttl = minimalDoc();
  negative_ttl["engine"]["order_ttl_ms"] = -1;
  EXPECT_THROW(bgcore::parseConfig(negative_ttl, kNoEnv), bgcore::ConfigError);

  auto bad_url = minimalDoc();
  bad_url["exchange"]["public_ws_url"] = "ws://insecure.example.com/ws";
  EXPECT_THROW(bgcore::parseConfig(bad_url, kNoEnv), bgcore::ConfigError);
}

TEST(EngineConfigTest, ParsesWebsocketUrls) {
  auto endpoint = bgcore::parseWebsocketUrl("wss://ws.bitget.com/v2/ws/private");
  EXPECT_EQ(endpoint.host, "ws.bitget.com");
  EXPECT_EQ(endpoint.port, "443");
  EXPECT_EQ(endpoint.path, "/v2/ws/private");

  endpoint = bgcore::parseWebsocketUrl("wss://localhost:8443");
  EXPECT_EQ(endpoint.host, "localhost");
  EXPECT_EQ(endpoint.port, "8443");
  EXPECT_EQ(endpoint.path, "/");

  EXPECT_THROW(bgcore::parseWebsocketUrl("wss://:443/x"), bgcore::ConfigError);
  EXPECT_THROW(bgcore::parseWebsocketUrl("wss:///path"), bgcore::ConfigError);
}

TEST(EngineConfigTest, LoadConfigReadsFile) {
  const std::string path = ::testing::TempDir() + "bgcore_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"instruments":[{"symbol":"ETHUSDT"}],"strategy":{"name":"hold"}})";
  }
  const auto config = bgcore::loadConfig(path, kNoEnv);
  EXPECT_EQ(config.symbols(), (std::vector<std::string>{"ETHUSDT"}));
  std::remove(path.c_str());

  EXPECT_THROW(bgcore::loadConfig(path, kNoEnv), bgcore::ConfigError);

  const std::string broken = ::testing::TempDir() + "bgcore_config_broken.json";
  {
    std::ofstream out(broken);
    out << "{\"instruments\": [";
  }
  EXPECT_THROW(bgcore::loadConfig(broken, kNoEnv), bgcore::ConfigError);
  std::remove(broken.c_str());
}
