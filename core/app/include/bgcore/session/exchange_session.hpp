#pragma once

#include "bgcore/domain/instrument.hpp"
#include "bgcore/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bgcore {

struct Credentials {
  std::string api_key;
  std::string api_secret;
  std::string passphrase;

  bool complete() const {
    return !api_key.empty() && !api_secret.empty() && !passphrase.empty();
  }
};

// -----------------------------------------------------------------------------
// ExchangeSession
// -----------------------------------------------------------------------------
//
// @brief  The one place that holds per-run exchange state: credentials,
//         product type and margin coin, the instrument registry, the measured
//         clock offset to the exchange, and the halt switch.
//
// @details
// Created by main() (or a test), then passed by reference into the transport,
// ledger, cache and coordinator constructors. There is no global session.
//
// The halt switch latches: once halt() is called, halted() stays true for the
// rest of the run and haltReason() keeps the first reason given.
//
// Thread model:
//   Instruments are guarded by a mutex (written at startup, read everywhere).
//   Clock offset and halt flag are atomics.
// -----------------------------------------------------------------------------
class ExchangeSession {
 public:
  ExchangeSession(Credentials credentials, std::string product_type,
                  std::string margin_coin, const ITimeProvider& clock);

  ExchangeSession(const ExchangeSession&) = delete;
  ExchangeSession& operator=(const ExchangeSession&) = delete;

  const Credentials& credentials() const { return credentials_; }
  const std::string& productType() const { return product_type_; }
  const std::string& marginCoin() const { return margin_coin_; }
  const ITimeProvider& clock() const { return clock_; }

  void setInstruments(const std::vector<domain::Instrument>& instruments);
  void addInstrument(const domain::Instrument& instrument);
  std::optional<domain::Instrument> instrument(const std::string& symbol) const;
  std::vector<domain::Instrument> instruments() const;

  // exchange time - local time, measured against /api/v2/public/time.
  void setClockOffsetMs(std::int64_t offset_ms) { clock_offset_ms_.store(offset_ms); }
  std::int64_t clockOffsetMs() const { return clock_offset_ms_.load(); }

  // Local clock corrected by the measured offset.
  std::int64_t exchangeNowMs() const {
    return clock_.now_ms() + clock_offset_ms_.load();
  }

  // Returns true if this call flipped the switch.
  bool halt(const std::string& reason);
  bool halted() const { return halted_.load(); }
  std::string haltReason() const;

 private:
  const Credentials credentials_;
  const std::string product_type_;
  const std::string margin_coin_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;  // Protects instruments_ and halt_reason_
  std::map<std::string, domain::Instrument> instruments_;
  std::string halt_reason_;

  std::atomic<std::int64_t> clock_offset_ms_{0};
  std::atomic<bool> halted_{false};
};

}  // namespace bgcore
