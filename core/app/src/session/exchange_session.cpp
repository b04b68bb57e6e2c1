#include "bgcore/session/exchange_session.hpp"

#include <iostream>

namespace bgcore {

ExchangeSession::ExchangeSession(Credentials credentials,
                                 std::string product_type,
                                 std::string margin_coin,
                                 const ITimeProvider& clock)
    : credentials_(std::move(credentials)),
      product_type_(std::move(product_type)),
      margin_coin_(std::move(margin_coin)),
      clock_(clock) {}

void ExchangeSession::setInstruments(
    const std::vector<domain::Instrument>& instruments) {
  std::lock_guard lock(mutex_);
  instruments_.clear();
  for (const auto& instrument : instruments) {
    instruments_[instrument.symbol] = instrument;
  }
}

void ExchangeSession::addInstrument(const domain::Instrument& instrument) {
  std::lock_guard lock(mutex_);
  instruments_[instrument.symbol] = instrument;
}

std::optional<domain::Instrument> ExchangeSession::instrument(
    const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = instruments_.find(symbol);
  if (it == instruments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Instrument> ExchangeSession::instruments() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Instrument> out;
  out.reserve(instruments_.size());
  for (const auto& [symbol, instrument] : instruments_) {
    out.push_back(instrument);
  }
  return out;
}

bool ExchangeSession::halt(const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (halted_.load()) {
    return false;
  }
  halt_reason_ = reason;
  halted_.store(true);
  std::cerr << "[ExchangeSession] TRADING HALTED: " << reason << std::endl;
  return true;
}

std::string ExchangeSession::haltReason() const {
  std::lock_guard lock(mutex_);
  return halt_reason_;
}

}  // namespace bgcore
