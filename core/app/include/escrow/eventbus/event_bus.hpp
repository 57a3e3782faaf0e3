#pragma once

#include "escrow/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel between the EscrowEngine and
// whoever observes it (the node's telemetry bridge, tests, audit loggers).
// The engine publishes after each committed operation and does not know who
// is listening.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe and publish.
// Callbacks run synchronously on the publishing thread before publish()
// returns. There is no dispatcher thread.
//
// Failure model: Every event describes a transition that is already committed.
// A subscriber that throws a std::exception is logged and counted, and the
// remaining subscribers still receive the event; publish() itself does not
// throw std::exception.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Receives every event; use std::get_if / std::visit to pick a type.
  using GenericCallback = std::function<void(const Event&)>;

  // Returned by subscribe(); pass to unsubscribe() to detach.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked for every published event.
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only when the event holds an EventType
  // (e.g. AgreementUpdateEvent). Implemented as a generic subscription that
  // filters on the variant alternative.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // Removes the subscription. Unknown ids are ignored. A publish() already in
  // progress on another thread may still deliver its current event to the
  // removed callback.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers the event to every current subscriber, in subscription order.
  // The subscriber list is copied under the lock and callbacks run without
  // it, so a callback may publish, subscribe or unsubscribe.
  // A subscriber's std::exception is reported on stderr as
  //   [EventBus] ERROR: subscriber <id> failed on <event type>: <what>
  // and delivery moves on to the next subscriber.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Number of live subscriptions.
  std::size_t subscriberCount() const;

  // Deliveries that ended in a subscriber exception since construction.
  std::uint64_t deliveryFailures() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
  std::atomic<std::uint64_t> delivery_failures_{0};
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

}  // namespace escrow
