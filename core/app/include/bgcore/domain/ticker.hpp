#pragma once

#include <cstdint>
#include <string>

namespace bgcore {
namespace domain {

// Latest ticker / last-trade information for one instrument. Fields the
// source did not provide stay at 0.
struct Ticker {
  std::string symbol;
  double last_price{0.0};
  double best_bid{0.0};
  double best_ask{0.0};
  double volume_24h{0.0};
  double change_24h{0.0};   // Fractional change, 0.015 == +1.5%
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace bgcore
