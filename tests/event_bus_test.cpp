// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for bgcore::EventBus.
//
// Validates:
//   - Generic subscribers see every alternative of the Event variant
//   - subscribe<T>() delivers only T
//   - unsubscribe() stops delivery; unknown ids are harmless
//   - A subscriber may publish from inside its callback
//   - A throwing subscriber does not stop delivery to the others
//
// All tests are single-threaded; cross-thread delivery is covered in
// event_loop_thread_test.cpp.
// =============================================================================

#include "bgcore/eventbus/event_bus.hpp"
#include "bgcore/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

bgcore::TickerEvent makeTicker(const std::string& symbol, double last) {
  bgcore::TickerEvent e;
  e.symbol = symbol;
  e.last_price = last;
  e.best_bid = last - 0.5;
  e.best_ask = last + 0.5;
  return e;
}

bgcore::FillEvent makeFill(bgcore::domain::OrderId id, const std::string& fill_id) {
  bgcore::FillEvent e;
  e.client_id = id;
  e.fill_id = fill_id;
  e.symbol = "BTCUSDT";
  e.price = 30000.0;
  e.quantity = 0.01;
  return e;
}

}  // namespace

class EventBusTest : public ::testing::Test {
 protected:
  bgcore::EventBus bus;
};

TEST_F(EventBusTest, GenericSubscriberReceivesEveryKind) {
  std::vector<std::size_t> indices;
  bus.subscribe([&](const bgcore::Event& e) { indices.push_back(e.index()); });

  bus.publish(makeTicker("BTCUSDT", 30000.0));
  bus.publish(makeFill(1, "t-1"));
  bus.publish(bgcore::HeartbeatEvent{"public", "pong"});
  bus.publish(bgcore::RiskRejectEvent{"s", "BTCUSDT", "max position"});

  ASSERT_EQ(indices.size(), 4u);
  EXPECT_NE(indices[0], indices[1]);
  EXPECT_NE(indices[1], indices[2]);
}

// -----------------------------------------------------------------------------
// Typed subscription: the ledger telemetry bridge subscribes to one kind and
// must never be handed another.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByAlternative) {
  int fills = 0;
  double last_qty = 0.0;
  bus.subscribe<bgcore::FillEvent>([&](const bgcore::FillEvent& f) {
    ++fills;
    last_qty = f.quantity;
  });

  bus.publish(makeTicker("BTCUSDT", 30000.0));
  bus.publish(makeFill(3, "t-9"));
  bus.publish(bgcore::DecisionTickEvent{"BTCUSDT"});

  EXPECT_EQ(fills, 1);
  EXPECT_DOUBLE_EQ(last_qty, 0.01);
}

TEST_F(EventBusTest, AllSubscribersOfAKindReceiveTheEvent) {
  int a = 0;
  int b = 0;
  bus.subscribe<bgcore::TickerEvent>([&](const bgcore::TickerEvent&) { ++a; });
  bus.subscribe<bgcore::TickerEvent>([&](const bgcore::TickerEvent&) { ++b; });

  bus.publish(makeTicker("ETHUSDT", 2000.0));

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int count = 0;
  auto id = bus.subscribe([&](const bgcore::Event&) { ++count; });
  bus.publish(makeTicker("BTCUSDT", 1.0));
  bus.unsubscribe(id);
  bus.publish(makeTicker("BTCUSDT", 2.0));

  EXPECT_EQ(count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.unsubscribe(12345);  // Unknown id: no effect, no throw.
  bus.publish(makeTicker("BTCUSDT", 3.0));
}

// -----------------------------------------------------------------------------
// Re-entrant publish: the bus releases its lock before invoking callbacks, so
// a subscriber can publish a follow-up event without deadlocking.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberMayPublishFromCallback) {
  int ticks = 0;
  bus.subscribe<bgcore::TickerEvent>([&](const bgcore::TickerEvent& t) {
    bus.publish(bgcore::DecisionTickEvent{t.symbol});
  });
  bus.subscribe<bgcore::DecisionTickEvent>(
      [&](const bgcore::DecisionTickEvent& t) {
        EXPECT_EQ(t.symbol, "ETHUSDT");
        ++ticks;
      });

  bus.publish(makeTicker("ETHUSDT", 2000.0));
  EXPECT_EQ(ticks, 1);
}

TEST_F(EventBusTest, ThrowingSubscriberDoesNotBlockOthers) {
  int delivered = 0;
  bus.subscribe([](const bgcore::Event&) {
    throw std::runtime_error("subscriber failure");
  });
  bus.subscribe([&](const bgcore::Event&) { ++delivered; });

  EXPECT_NO_THROW(bus.publish(makeFill(1, "t-1")));
  EXPECT_EQ(delivered, 1);
}

TEST_F(EventBusTest, VariantCarriesPayloadIntact) {
  bgcore::ReconcileEvent received;
  bus.subscribe<bgcore::ReconcileEvent>(
      [&](const bgcore::ReconcileEvent& r) { received = r; });

  bgcore::ReconcileEvent sent;
  bgcore::OrderStatusReport report;
  report.client_id = 42;
  report.exchange_id = "ex-42";
  report.filled_quantity = 0.5;
  report.status = bgcore::domain::OrderStatus::Filled;
  sent.final_reports.push_back(report);
  sent.unknown_orders.push_back(7);
  sent.complete = false;
  bus.publish(sent);

  ASSERT_EQ(received.final_reports.size(), 1u);
  EXPECT_EQ(received.final_reports[0].client_id, 42u);
  EXPECT_EQ(received.final_reports[0].exchange_id, "ex-42");
  EXPECT_EQ(received.final_reports[0].status,
            bgcore::domain::OrderStatus::Filled);
  ASSERT_EQ(received.unknown_orders.size(), 1u);
  EXPECT_EQ(received.unknown_orders[0], 7u);
  EXPECT_FALSE(received.complete);
}
