#include "bgcore/domain/domain_json.hpp"

#include <stdexcept>

namespace bgcore {
namespace domain {

using json = nlohmann::json;

OrderStatus orderStatusFromString(const std::string& name) {
  for (auto status : {OrderStatus::Pending, OrderStatus::Acknowledged,
                      OrderStatus::PartiallyFilled, OrderStatus::Filled,
                      OrderStatus::Cancelled, OrderStatus::Rejected}) {
    if (name == toString(status)) {
      return status;
    }
  }
  throw std::invalid_argument("unknown order status: " + name);
}

Side sideFromString(const std::string& name) {
  if (name == "Buy") {
    return Side::Buy;
  }
  if (name == "Sell") {
    return Side::Sell;
  }
  throw std::invalid_argument("unknown side: " + name);
}

OrderType orderTypeFromString(const std::string& name) {
  if (name == "Limit") {
    return OrderType::Limit;
  }
  if (name == "Market") {
    return OrderType::Market;
  }
  throw std::invalid_argument("unknown order type: " + name);
}

void to_json(json& j, const Order& order) {
  j = json{{"id", order.id},
           {"exchange_id", order.exchange_id},
           {"strategy_id", order.strategy_id},
           {"symbol", order.symbol},
           {"side", toString(order.side)},
           {"type", toString(order.type)},
           {"price", order.price},
           {"quantity", order.quantity},
           {"filled_quantity", order.filled_quantity},
           {"average_fill_price", order.average_fill_price},
           {"reduce_only", order.reduce_only},
           {"status", toString(order.status)},
           {"created_ms", order.created_ms},
           {"updated_ms", order.updated_ms}};
}

void from_json(const json& j, Order& order) {
  j.at("id").get_to(order.id);
  order.exchange_id = j.value("exchange_id", std::string{});
  order.strategy_id = j.value("strategy_id", std::string{});
  j.at("symbol").get_to(order.symbol);
  order.side = sideFromString(j.at("side").get<std::string>());
  order.type = orderTypeFromString(j.value("type", std::string{"Limit"}));
  j.at("price").get_to(order.price);
  j.at("quantity").get_to(order.quantity);
  order.filled_quantity = j.value("filled_quantity", 0.0);
  order.average_fill_price = j.value("average_fill_price", 0.0);
  order.reduce_only = j.value("reduce_only", false);
  order.status = orderStatusFromString(j.at("status").get<std::string>());
  order.created_ms = j.value("created_ms", std::int64_t{0});
  order.updated_ms = j.value("updated_ms", std::int64_t{0});
}

void to_json(json& j, const Position& position) {
  j = json{{"symbol", position.symbol},
           {"net_quantity", position.net_quantity},
           {"average_price", position.average_price},
           {"realized_pnl", position.realized_pnl},
           {"unrealized_pnl", position.unrealized_pnl}};
}

void from_json(const json& j, Position& position) {
  j.at("symbol").get_to(position.symbol);
  j.at("net_quantity").get_to(position.net_quantity);
  j.at("average_price").get_to(position.average_price);
  position.realized_pnl = j.value("realized_pnl", 0.0);
  position.unrealized_pnl = j.value("unrealized_pnl", 0.0);
}

void to_json(json& j, const Balance& balance) {
  j = json{{"asset", balance.asset},
           {"available", balance.available},
           {"reserved", balance.reserved},
           {"total", balance.total}};
}

void from_json(const json& j, Balance& balance) {
  j.at("asset").get_to(balance.asset);
  j.at("available").get_to(balance.available);
  balance.reserved = j.value("reserved", 0.0);
  balance.total = j.value("total", 0.0);
}

}  // namespace domain
}  // namespace bgcore
