#include "escrow/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>

namespace escrow {

namespace {

const char* eventTypeName(const Event& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, AgreementUpdateEvent>) {
          return "AgreementUpdateEvent";
        } else {
          return "FundsTransferredEvent";
        }
      },
      event);
}

}  // namespace

// -----------------------------------------------------------------------------
// subscribe(): append under the lock, hand back a fresh id
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(): erase-remove by id
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(): snapshot the subscriber list, call each entry without the lock
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;
  {
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  for (const auto& [id, callback] : copy) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      delivery_failures_.fetch_add(1);
      std::cerr << "[EventBus] ERROR: subscriber " << id << " failed on "
                << eventTypeName(event) << ": " << e.what() << "\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

std::uint64_t EventBus::deliveryFailures() const {
  return delivery_failures_.load();
}

}  // namespace escrow
