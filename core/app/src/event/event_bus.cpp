#include "backtest/eventbus/event_bus.hpp"

#include <algorithm>

namespace backtest {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
// Ids are handed out in increasing order, so the position of an entry in
// subscribers_ is also its delivery order. Typed subscribe<T>() wraps its
// callback in a generic one and ends up here.
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
// Unknown ids are ignored. A publish() already in flight still holds its own
// copy of the list and may deliver the current event to this subscriber one
// last time.
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
// The runner publishes from inside the day loop, and logging or test
// subscribers may call back into the runner (cancel()) or the bus itself
// (publish, unsubscribe). Callbacks therefore run on a copy taken under the
// lock, with the lock released.
//
// Exceptions from a callback propagate to the publisher; remaining
// subscribers do not see that event.
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& [id, callback] : snapshot) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace backtest
