#pragma once

#include "bgcore/domain/balance.hpp"
#include "bgcore/domain/order.hpp"
#include "bgcore/domain/order_status.hpp"
#include "bgcore/domain/position.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace bgcore {
namespace domain {

// nlohmann_json adapters, found by ADL. Used by the ledger snapshot file and
// by IPC telemetry. from_json throws nlohmann::json::exception on missing or
// mistyped fields.

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

void to_json(nlohmann::json& j, const Balance& balance);
void from_json(const nlohmann::json& j, Balance& balance);

// Inverse of toString(); throws std::invalid_argument on unknown names.
OrderStatus orderStatusFromString(const std::string& name);
Side sideFromString(const std::string& name);
OrderType orderTypeFromString(const std::string& name);

}  // namespace domain
}  // namespace bgcore
