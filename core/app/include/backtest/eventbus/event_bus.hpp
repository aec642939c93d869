#pragma once

#include "backtest/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish/subscribe channel for run progress.
//
// @details
// The runner publishes; loggers, progress reporters and tests subscribe.
// Nothing in the core depends on anyone listening: the result returned by
// BacktestRunner::run() is complete on its own.
//
// Callbacks run on the publishing thread before publish() returns, in
// subscription order. A callback may call publish(), subscribe() or
// unsubscribe() (it sees a snapshot of the list), or
// BacktestRunner::cancel().
//
// A callback that throws propagates out of publish() and therefore out of
// run(); subscribers are expected not to throw.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every event.
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only for events holding an EventType, e.g.
  //
  //   bus.subscribe<TradeExecutedEvent>(
  //       [](const TradeExecutedEvent& e) { ... });
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. A publish already in progress on another thread
  // may still invoke it once.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace backtest
