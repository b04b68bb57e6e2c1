#pragma once

#include "bgcore/domain/instrument.hpp"
#include "bgcore/strategy/book_imbalance_strategy.hpp"
#include "bgcore/strategy/i_strategy.hpp"

#include <memory>
#include <string>
#include <vector>

namespace bgcore {

// Builds the strategy named in the config: "hold" or "book_imbalance".
// Throws ConfigError for any other name.
std::unique_ptr<IStrategy> makeStrategy(
    const std::string& name, const BookImbalanceConfig& book_imbalance,
    const std::vector<domain::Instrument>& instruments);

}  // namespace bgcore
