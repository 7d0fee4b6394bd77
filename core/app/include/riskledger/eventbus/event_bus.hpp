#pragma once

#include "riskledger/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace riskledger {

// -----------------------------------------------------------------------------
// EventBus — synchronous typed publish/subscribe
// -----------------------------------------------------------------------------
//
// @brief  Fans Event values out to registered callbacks on the publishing
//         thread.
//
// @details
// ExecutionController publishes order, position, rejection and
// emergency-stop events here after each submission. Subscribers include the
// IpcServer telemetry bridge (which only enqueues) and tests.
//
// publish() copies the subscriber list under the mutex and invokes the
// callbacks after releasing it, so a callback may subscribe, unsubscribe or
// publish again without deadlocking.
//
// Typed subscription:
//   subscribe<OrderUpdateEvent>(cb) wraps cb in a generic callback that
//   filters with std::get_if, so cb only sees its own alternative.
//
// Thread-safety: all methods are safe from any thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
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

}  // namespace riskledger
