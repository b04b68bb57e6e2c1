#pragma once

#include "bgcore/time/i_time_provider.hpp"

namespace bgcore {

// Wall-clock ITimeProvider used in live and paper trading.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace bgcore
