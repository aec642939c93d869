// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for backtest::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event, in
//     subscription order
//   - Unsubscribe stops delivery; unknown ids are harmless
//   - Re-entrant publish (subscriber publishes inside callback), no deadlock
//   - Payloads survive the variant dispatch path
//
// All tests are single-threaded except the last, which publishes from
// several threads at once.
// =============================================================================

#include "backtest/eventbus/event_bus.hpp"
#include "backtest/events/event.hpp"
#include "backtest/events/event_types.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using backtest::test::day;

// =============================================================================
// Test fixture: provides a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  backtest::EventBus bus;

  static backtest::TradeExecutedEvent makeTrade(const std::string& symbol,
                                                double price) {
    backtest::TradeExecutedEvent e;
    e.trade.timestamp = day(3);
    e.trade.symbol = symbol;
    e.trade.side = backtest::domain::Side::Buy;
    e.trade.quantity = 100;
    e.trade.price = price;
    e.trade.commission = 5.0;
    e.trade.position_id = 7;
    e.timestamp = day(3);
    return e;
  }

  static backtest::SnapshotEvent makeSnapshot(double equity) {
    backtest::SnapshotEvent e;
    e.snapshot.date = day(3);
    e.snapshot.cash = equity;
    e.snapshot.total_equity = equity;
    e.timestamp = day(3);
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber must be invoked for every event type.
// Why: The driver's logger subscribes generically; a skipped alternative
//      would silently drop lines from the run log.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const backtest::Event&) { ++call_count; });

  bus.publish(backtest::BacktestStartedEvent{});
  bus.publish(makeTrade("AAPL", 150.0));
  bus.publish(backtest::OrderRejectedEvent{});
  bus.publish(backtest::StopLossTriggeredEvent{});
  bus.publish(makeSnapshot(100000.0));
  bus.publish(backtest::BacktestCompletedEvent{});

  EXPECT_EQ(call_count, 6);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber must fire only for its registered event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int trade_count = 0;
  bus.subscribe<backtest::TradeExecutedEvent>(
      [&trade_count](const backtest::TradeExecutedEvent&) { ++trade_count; });

  bus.publish(makeTrade("AAPL", 150.0));
  bus.publish(makeSnapshot(100000.0));
  bus.publish(backtest::OrderRejectedEvent{});

  EXPECT_EQ(trade_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Every subscriber receives the event, in the order they subscribed.
// Why: Subscribers observing the same run (a logger and a progress
//      reporter) must see one consistent sequence.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersReceiveInOrder) {
  std::vector<int> order;

  bus.subscribe<backtest::SnapshotEvent>(
      [&order](const backtest::SnapshotEvent&) { order.push_back(1); });
  bus.subscribe([&order](const backtest::Event&) { order.push_back(2); });
  bus.subscribe<backtest::SnapshotEvent>(
      [&order](const backtest::SnapshotEvent&) { order.push_back(3); });

  bus.publish(makeSnapshot(100000.0));

  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(bus.subscriberCount(), 3u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback must not fire for future publishes.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<backtest::TradeExecutedEvent>(
      [&call_count](const backtest::TradeExecutedEvent&) { ++call_count; });

  bus.publish(makeTrade("AAPL", 150.0));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeTrade("AAPL", 151.0));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeTrade("AAPL", 150.0)));
}

// -----------------------------------------------------------------------------
// 6. A subscriber that calls publish() inside its callback must not deadlock.
// Why: The bus copies the subscriber list before invoking callbacks. If it
//      held the lock across callbacks, this test would hang forever.
//
// Scenario: subscriber A receives a StopLossTriggeredEvent and publishes a
//           TradeExecutedEvent. Subscriber B receives the trade.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int trades_received = 0;

  bus.subscribe<backtest::TradeExecutedEvent>(
      [&trades_received](const backtest::TradeExecutedEvent&) {
        ++trades_received;
      });

  bus.subscribe<backtest::StopLossTriggeredEvent>(
      [this](const backtest::StopLossTriggeredEvent& stop) {
        bus.publish(makeTrade(stop.symbol, stop.trigger_price));
      });

  backtest::StopLossTriggeredEvent stop;
  stop.symbol = "AAPL";
  stop.trigger_price = 44.0;
  bus.publish(stop);

  EXPECT_EQ(trades_received, 1);
}

TEST_F(EventBusTest, SubscriberCanUnsubscribeItself) {
  int call_count = 0;
  backtest::EventBus::SubscriptionId id = 0;
  id = bus.subscribe([&](const backtest::Event&) {
    ++call_count;
    bus.unsubscribe(id);
  });

  bus.publish(makeSnapshot(1.0));
  bus.publish(makeSnapshot(2.0));

  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 7. Field values must survive the variant round trip: publish -> dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  backtest::domain::TradeRecord received;

  bus.subscribe<backtest::TradeExecutedEvent>(
      [&received](const backtest::TradeExecutedEvent& e) {
        received = e.trade;
      });

  bus.publish(makeTrade("TSLA", 237.50));

  EXPECT_EQ(received.symbol, "TSLA");
  EXPECT_DOUBLE_EQ(received.price, 237.50);
  EXPECT_EQ(received.quantity, 100);
  EXPECT_EQ(received.position_id, 7u);
  EXPECT_EQ(received.timestamp, day(3));
}

// -----------------------------------------------------------------------------
// 8. Concurrent publishers: every event is delivered exactly once.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ConcurrentPublishDeliversEverything) {
  std::atomic<int> received{0};
  bus.subscribe<backtest::SnapshotEvent>(
      [&received](const backtest::SnapshotEvent&) { received.fetch_add(1); });

  constexpr int kThreads = 4;
  constexpr int kEventsPerThread = 250;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < kEventsPerThread; ++i) {
        bus.publish(makeSnapshot(static_cast<double>(i)));
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  EXPECT_EQ(received.load(), kThreads * kEventsPerThread);
}
