#include "bgcore/strategy/strategy_factory.hpp"

#include "bgcore/domain/errors.hpp"
#include "bgcore/strategy/hold_strategy.hpp"

namespace bgcore {

std::unique_ptr<IStrategy> makeStrategy(
    const std::string& name, const BookImbalanceConfig& book_imbalance,
    const std::vector<domain::Instrument>& instruments) {
  if (name == "hold") {
    return std::make_unique<HoldStrategy>();
  }
  if (name == "book_imbalance") {
    return std::make_unique<BookImbalanceStrategy>(book_imbalance, instruments);
  }
  throw ConfigError("unknown strategy \"" + name + "\"");
}

}  // namespace bgcore
