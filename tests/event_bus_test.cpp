// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for escrow::EventBus.
//
// Validates:
//   - Generic subscription receives both event types
//   - Typed subscription receives only its own type
//   - Delivery order follows subscription order
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A subscriber may publish from inside its callback
//   - A throwing subscriber is logged and counted; delivery continues
//
// All tests are single-threaded. The cross-thread path (bus → telemetry
// queue → IPC worker) is exercised in escrow_node_test.cpp.
// =============================================================================

#include "escrow/eventbus/event_bus.hpp"
#include "escrow/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  escrow::EventBus bus;

  static escrow::AgreementUpdateEvent makeUpdate(
      escrow::domain::AgreementId id, const std::string& operation) {
    escrow::AgreementUpdateEvent e;
    e.agreement.id = id;
    e.operation = operation;
    e.caller = "buyer";
    return e;
  }

  static escrow::FundsTransferredEvent makeTransfer(
      escrow::domain::AgreementId id, escrow::domain::Amount amount) {
    escrow::FundsTransferredEvent e;
    e.agreement_id = id;
    e.from = "buyer";
    e.to = "escrow-custody";
    e.amount = amount;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every event type.
// Why: main() logs through generic and typed subscribers; the telemetry
//      bridge must never miss an event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const escrow::Event&) { ++call_count; });

  bus.publish(makeUpdate(1, "create"));
  bus.publish(makeTransfer(1, 100));

  EXPECT_EQ(call_count, 2);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int updates = 0;
  int transfers = 0;
  bus.subscribe<escrow::AgreementUpdateEvent>(
      [&updates](const escrow::AgreementUpdateEvent&) { ++updates; });
  bus.subscribe<escrow::FundsTransferredEvent>(
      [&transfers](const escrow::FundsTransferredEvent&) { ++transfers; });

  bus.publish(makeUpdate(1, "create"));
  bus.publish(makeTransfer(1, 100));
  bus.publish(makeUpdate(1, "fund"));

  EXPECT_EQ(updates, 2);
  EXPECT_EQ(transfers, 1);
}

// -----------------------------------------------------------------------------
// 3. Subscribers are called in the order they subscribed.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, DeliveryFollowsSubscriptionOrder) {
  std::vector<char> order;
  bus.subscribe([&order](const escrow::Event&) { order.push_back('a'); });
  bus.subscribe([&order](const escrow::Event&) { order.push_back('b'); });
  bus.subscribe([&order](const escrow::Event&) { order.push_back('c'); });

  bus.publish(makeUpdate(1, "create"));

  EXPECT_EQ(order, (std::vector<char>{'a', 'b', 'c'}));
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id) the callback no longer fires.
// Why: EscrowNode::stop() detaches the telemetry bridge before it destroys
//      the IPC server the bridge points at.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<escrow::AgreementUpdateEvent>(
      [&call_count](const escrow::AgreementUpdateEvent&) { ++call_count; });
  EXPECT_EQ(bus.subscriberCount(), 1u);

  bus.publish(makeUpdate(1, "create"));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeUpdate(1, "fund"));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeUnknownIdAndPublishToEmptyBus) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeTransfer(1, 1)));
}

// -----------------------------------------------------------------------------
// 6. A subscriber that publishes inside its callback must not deadlock.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int updates_received = 0;

  bus.subscribe<escrow::AgreementUpdateEvent>(
      [&updates_received](const escrow::AgreementUpdateEvent&) {
        ++updates_received;
      });

  bus.subscribe<escrow::FundsTransferredEvent>(
      [this](const escrow::FundsTransferredEvent& e) {
        bus.publish(makeUpdate(e.agreement_id, "fund"));
      });

  bus.publish(makeTransfer(7, 500));

  EXPECT_EQ(updates_received, 1);
}

// -----------------------------------------------------------------------------
// 7. Payloads arrive unchanged.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  escrow::FundsTransferredEvent received;

  bus.subscribe<escrow::FundsTransferredEvent>(
      [&received](const escrow::FundsTransferredEvent& e) { received = e; });

  bus.publish(makeTransfer(42, 1234));

  EXPECT_EQ(received.agreement_id, 42u);
  EXPECT_EQ(received.from, "buyer");
  EXPECT_EQ(received.to, "escrow-custody");
  EXPECT_EQ(received.amount, 1234u);
}

// -----------------------------------------------------------------------------
// 8. A subscriber that throws does not stop delivery to the ones after it,
//    and publish() returns normally.
// Why: The engine publishes after committing. An observer failure must not
//      look like a failed transition to the caller.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberIsIsolated) {
  int after = 0;
  bus.subscribe([](const escrow::Event&) {
    throw std::runtime_error("audit sink unavailable");
  });
  bus.subscribe([&after](const escrow::Event&) { ++after; });

  EXPECT_NO_THROW(bus.publish(makeUpdate(1, "create")));
  EXPECT_NO_THROW(bus.publish(makeTransfer(1, 100)));

  EXPECT_EQ(after, 2);
  EXPECT_EQ(bus.deliveryFailures(), 2u);
}
