#include "bgcore/engine/engine_config.hpp"

#include "bgcore/domain/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace bgcore {

using json = nlohmann::json;

namespace {

// Copies section[key] into out when present. Type mismatches become
// ConfigError naming the offending key.
template <typename T>
void read(const json& section, const std::string& where, const char* key,
          T& out) {
  if (!section.contains(key) || section.at(key).is_null()) {
    return;
  }
  try {
    out = section.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigError("config " + where + "." + key + ": " + e.what());
  }
}

const json& section(const json& doc, const char* name) {
  static const json kEmpty = json::object();
  if (!doc.contains(name)) {
    return kEmpty;
  }
  const json& s = doc.at(name);
  if (!s.is_object()) {
    throw ConfigError(std::string("config section '") + name +
                      "' must be an object");
  }
  return s;
}

void readBucket(const json& limits, const char* key, BucketLimits& bucket) {
  if (!limits.contains(key)) {
    return;
  }
  const json& b = limits.at(key);
  if (!b.is_object()) {
    throw ConfigError(std::string("config rate_limits.") + key +
                      " must be an object");
  }
  const std::string where = std::string("rate_limits.") + key;
  read(b, where, "capacity", bucket.capacity);
  read(b, where, "refill_per_sec", bucket.refill_per_sec);
}

domain::Instrument readInstrument(const json& j, std::size_t index) {
  const std::string where = "instruments[" + std::to_string(index) + "]";
  if (!j.is_object()) {
    throw ConfigError("config " + where + " must be an object");
  }
  domain::Instrument instrument;
  read(j, where, "symbol", instrument.symbol);
  if (instrument.symbol.empty()) {
    throw ConfigError("config " + where + ".symbol is required");
  }
  read(j, where, "base_asset", instrument.base_asset);
  read(j, where, "quote_asset", instrument.quote_asset);
  read(j, where, "price_precision", instrument.price_precision);
  read(j, where, "quantity_precision", instrument.quantity_precision);
  read(j, where, "min_quantity", instrument.min_quantity);
  read(j, where, "min_notional", instrument.min_notional);
  read(j, where, "price_tick", instrument.price_tick);
  return instrument;
}

TradingMode parseMode(const std::string& mode) {
  if (mode == "live") {
    return TradingMode::Live;
  }
  if (mode == "paper") {
    return TradingMode::Paper;
  }
  throw ConfigError("config exchange.mode must be \"live\" or \"paper\", got \"" +
                    mode + "\"");
}

}  // namespace

const char* toString(TradingMode mode) {
  return mode == TradingMode::Live ? "live" : "paper";
}

std::optional<std::string> processEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

std::vector<std::string> EngineConfig::symbols() const {
  std::vector<std::string> out;
  out.reserve(instruments.size());
  for (const auto& instrument : instruments) {
    out.push_back(instrument.symbol);
  }
  return out;
}

BitgetTransportConfig EngineConfig::transportConfig() const {
  BitgetTransportConfig t;
  t.rest_base_url = exchange.rest_base_url;
  t.rest_timeout_ms = exchange.rest_timeout_ms;
  t.rest_connect_timeout_ms = exchange.rest_connect_timeout_ms;
  t.query_retries = exchange.query_retries;
  t.public_stream = parseWebsocketUrl(exchange.public_ws_url);
  t.private_stream = parseWebsocketUrl(exchange.private_ws_url);
  t.symbols = symbols();
  t.book_depth = exchange.book_depth;
  t.clock_skew_tolerance_ms = exchange.clock_skew_tolerance_ms;
  t.rate_limits = rate_limits;
  t.reconnect = reconnect;
  t.heartbeat = exchange.heartbeat;
  return t;
}

StreamEndpoint parseWebsocketUrl(const std::string& url) {
  const std::string scheme = "wss://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    throw ConfigError("websocket url must start with wss://: " + url);
  }
  const std::string rest = url.substr(scheme.size());
  const auto slash = rest.find('/');
  const std::string authority = rest.substr(0, slash);
  if (authority.empty()) {
    throw ConfigError("websocket url has no host: " + url);
  }

  StreamEndpoint endpoint;
  endpoint.path = slash == std::string::npos ? "/" : rest.substr(slash);
  const auto colon = authority.find(':');
  if (colon == std::string::npos) {
    endpoint.host = authority;
    endpoint.port = "443";
  } else {
    endpoint.host = authority.substr(0, colon);
    endpoint.port = authority.substr(colon + 1);
    if (endpoint.host.empty() || endpoint.port.empty()) {
      throw ConfigError("malformed websocket url: " + url);
    }
  }
  return endpoint;
}

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const json& doc, const EnvLookup& env) {
  if (!doc.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }
  EngineConfig config;

  // --- exchange --------------------------------------------------------------
  const json& ex = section(doc, "exchange");
  std::string mode = toString(config.exchange.mode);
  read(ex, "exchange", "mode", mode);
  config.exchange.mode = parseMode(mode);
  read(ex, "exchange", "product_type", config.exchange.product_type);
  read(ex, "exchange", "margin_coin", config.exchange.margin_coin);
  read(ex, "exchange", "rest_base_url", config.exchange.rest_base_url);
  read(ex, "exchange", "public_ws_url", config.exchange.public_ws_url);
  read(ex, "exchange", "private_ws_url", config.exchange.private_ws_url);
  read(ex, "exchange", "rest_timeout_ms", config.exchange.rest_timeout_ms);
  read(ex, "exchange", "rest_connect_timeout_ms",
       config.exchange.rest_connect_timeout_ms);
  read(ex, "exchange", "query_retries", config.exchange.query_retries);
  read(ex, "exchange", "book_depth", config.exchange.book_depth);
  read(ex, "exchange", "clock_skew_tolerance_ms",
       config.exchange.clock_skew_tolerance_ms);
  read(ex, "exchange", "load_instruments", config.exchange.load_instruments);
  read(ex, "exchange", "ping_interval_ms",
       config.exchange.heartbeat.ping_interval_ms);
  read(ex, "exchange", "pong_timeout_ms",
       config.exchange.heartbeat.pong_timeout_ms);

  // --- instruments -----------------------------------------------------------
  if (doc.contains("instruments")) {
    const json& list = doc.at("instruments");
    if (!list.is_array()) {
      throw ConfigError("config 'instruments' must be an array");
    }
    for (std::size_t i = 0; i < list.size(); ++i) {
      domain::Instrument instrument = readInstrument(list[i], i);
      if (instrument.quote_asset.empty()) {
        instrument.quote_asset = config.exchange.margin_coin;
      }
      config.instruments.push_back(std::move(instrument));
    }
  }

  // --- risk ------------------------------------------------------------------
  const json& risk = section(doc, "risk");
  std::vector<std::string> allowed;
  read(risk, "risk", "allowed_instruments", allowed);
  if (allowed.empty()) {
    allowed = config.symbols();
  }
  config.risk.allowed_instruments.insert(allowed.begin(), allowed.end());
  read(risk, "risk", "max_position_per_instrument",
       config.risk.max_position_per_instrument);
  read(risk, "risk", "max_order_notional", config.risk.max_order_notional);
  read(risk, "risk", "max_open_orders", config.risk.max_open_orders);
  read(risk, "risk", "min_order_interval_ms", config.risk.min_order_interval_ms);
  read(risk, "risk", "max_drawdown", config.risk.max_drawdown);

  // --- rate_limits -----------------------------------------------------------
  const json& limits = section(doc, "rate_limits");
  readBucket(limits, "place_order", config.rate_limits.place_order);
  readBucket(limits, "cancel_order", config.rate_limits.cancel_order);
  readBucket(limits, "query", config.rate_limits.query);
  readBucket(limits, "market_data", config.rate_limits.market_data);
  read(limits, "rate_limits", "max_wait_ms", config.rate_limits.max_wait_ms);

  // --- reconnect -------------------------------------------------------------
  const json& reconnect = section(doc, "reconnect");
  read(reconnect, "reconnect", "base_ms", config.reconnect.base_ms);
  read(reconnect, "reconnect", "cap_ms", config.reconnect.cap_ms);
  read(reconnect, "reconnect", "jitter", config.reconnect.jitter);

  // --- strategy --------------------------------------------------------------
  const json& strategy = section(doc, "strategy");
  read(strategy, "strategy", "name", config.strategy.name);
  BookImbalanceConfig& bi = config.strategy.book_imbalance;
  read(strategy, "strategy", "id", bi.strategy_id);
  read(strategy, "strategy", "depth_levels", bi.depth_levels);
  read(strategy, "strategy", "confidence_threshold", bi.confidence_threshold);
  read(strategy, "strategy", "max_position_percent", bi.max_position_percent);
  read(strategy, "strategy", "max_position_value", bi.max_position_value);
  read(strategy, "strategy", "min_order_value", bi.min_order_value);
  read(strategy, "strategy", "min_balance", bi.min_balance);
  read(strategy, "strategy", "stop_loss_percent", bi.stop_loss_percent);
  read(strategy, "strategy", "take_profit_percent", bi.take_profit_percent);

  // --- engine ----------------------------------------------------------------
  const json& engine = section(doc, "engine");
  read(engine, "engine", "decision_interval_ms",
       config.engine.decision_interval_ms);
  read(engine, "engine", "stream_queue_capacity",
       config.engine.stream_queue_capacity);
  read(engine, "engine", "shutdown_grace_ms", config.engine.shutdown_grace_ms);
  read(engine, "engine", "pending_timeout_ms", config.engine.pending_timeout_ms);
  read(engine, "engine", "order_ttl_ms", config.engine.order_ttl_ms);

  // --- ipc -------------------------------------------------------------------
  const json& ipc = section(doc, "ipc");
  read(ipc, "ipc", "enabled", config.ipc.enabled);
  read(ipc, "ipc", "cmd_endpoint", config.ipc.cmd_endpoint);
  read(ipc, "ipc", "pub_endpoint", config.ipc.pub_endpoint);

  // --- persistence -----------------------------------------------------------
  const json& persistence = section(doc, "persistence");
  read(persistence, "persistence", "snapshot_path",
       config.persistence.snapshot_path);
  read(persistence, "persistence", "save_interval_ms",
       config.persistence.save_interval_ms);

  // --- paper -----------------------------------------------------------------
  const json& paper = section(doc, "paper");
  read(paper, "paper", "initial_balance", config.paper.initial_balance);
  read(paper, "paper", "fee_rate", config.paper.fee_rate);
  config.paper.instruments = config.instruments;

  // --- credentials (environment only) ----------------------------------------
  config.credentials.api_key = env("BITGET_API_KEY").value_or("");
  config.credentials.api_secret = env("BITGET_API_SECRET").value_or("");
  config.credentials.passphrase = env("BITGET_API_PASSPHRASE").value_or("");

  validateConfig(config);
  return config;
}

EngineConfig loadConfig(const std::string& path, const EnvLookup& env) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  json doc;
  try {
    doc = json::parse(buffer.str());
  } catch (const json::parse_error& e) {
    throw ConfigError("config file " + path + " is not valid JSON: " +
                      e.what());
  }
  EngineConfig config = parseConfig(doc, env);
  std::cout << "[Config] Loaded " << path << " (mode="
            << toString(config.exchange.mode) << ", "
            << config.instruments.size() << " instruments, strategy="
            << config.strategy.name << ")" << std::endl;
  return config;
}

// -----------------------------------------------------------------------------
// validateConfig
// -----------------------------------------------------------------------------
void validateConfig(const EngineConfig& config) {
  if (config.instruments.empty()) {
    throw ConfigError("config needs at least one instrument");
  }
  for (const auto& instrument : config.instruments) {
    if (instrument.quantity_precision < 0 || instrument.price_precision < 0) {
      throw ConfigError("instrument " + instrument.symbol +
                        " has a negative precision");
    }
  }
  if (config.exchange.mode == TradingMode::Live &&
      !config.credentials.complete()) {
    throw ConfigError(
        "live mode needs BITGET_API_KEY, BITGET_API_SECRET and "
        "BITGET_API_PASSPHRASE");
  }
  if (config.risk.max_position_per_instrument <= 0.0 ||
      config.risk.max_order_notional <= 0.0) {
    throw ConfigError("risk limits must be positive");
  }
  if (config.risk.max_open_orders == 0) {
    throw ConfigError("risk.max_open_orders must be at least 1");
  }
  if (config.risk.min_order_interval_ms < 0) {
    throw ConfigError("risk.min_order_interval_ms must not be negative");
  }
  if (config.risk.max_drawdown > 0.0) {
    throw ConfigError("risk.max_drawdown is a loss floor and must be <= 0");
  }
  if (config.reconnect.base_ms <= 0 ||
      config.reconnect.cap_ms < config.reconnect.base_ms) {
    throw ConfigError("reconnect needs 0 < base_ms <= cap_ms");
  }
  if (config.reconnect.jitter < 0.0 || config.reconnect.jitter >= 1.0) {
    throw ConfigError("reconnect.jitter must be in [0, 1)");
  }
  for (const BucketLimits* bucket :
       {&config.rate_limits.place_order, &config.rate_limits.cancel_order,
        &config.rate_limits.query, &config.rate_limits.market_data}) {
    if (bucket->capacity < 1.0 || bucket->refill_per_sec <= 0.0) {
      throw ConfigError("rate limit buckets need capacity >= 1 and a "
                        "positive refill rate");
    }
  }
  if (config.engine.decision_interval_ms <= 0 ||
      config.engine.stream_queue_capacity == 0) {
    throw ConfigError("engine.decision_interval_ms and "
                      "engine.stream_queue_capacity must be positive");
  }
  if (config.engine.pending_timeout_ms < 0 || config.engine.order_ttl_ms < 0) {
    throw ConfigError("engine.pending_timeout_ms and engine.order_ttl_ms "
                      "must not be negative");
  }
  if (config.strategy.name != "hold" && config.strategy.name != "book_imbalance") {
    throw ConfigError("unknown strategy \"" + config.strategy.name + "\"");
  }
  const int threshold = config.strategy.book_imbalance.confidence_threshold;
  if (threshold < 0 || threshold > 10) {
    throw ConfigError("strategy.confidence_threshold must be in 0..10");
  }
  // Both URLs must parse even in paper mode: the public stream is real.
  parseWebsocketUrl(config.exchange.public_ws_url);
  parseWebsocketUrl(config.exchange.private_ws_url);
}

}  // namespace bgcore
