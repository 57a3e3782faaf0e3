// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for escrow::ThreadSafeQueue<T>.
//
// Validates:
//   - drain() returns everything pushed, oldest first, and empties the queue
//   - drain() on an empty queue returns an empty batch
//   - Event variants (the telemetry payload) survive the queue intact
//   - No lost or duplicated items with several producers and one drainer
//
// All spawned threads are joined before the assertions that depend on them.
// =============================================================================

#include "escrow/concurrent/thread_safe_queue.hpp"
#include "escrow/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  escrow::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. One drain() takes the whole backlog in push order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, DrainReturnsBacklogInOrder) {
  for (int i = 0; i < 10; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 10u);

  std::vector<int> batch = queue.drain();
  ASSERT_EQ(batch.size(), 10u);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(batch[i], i) << "FIFO violated at index " << i;
  }
  EXPECT_EQ(queue.size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. drain() never waits.
// Why: The IPC worker drains between command polls. A blocking call there
//      would stall the REP socket.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, DrainOnEmptyQueueReturnsNothing) {
  EXPECT_TRUE(queue.drain().empty());

  queue.push(99);
  EXPECT_EQ(queue.drain(), std::vector<int>{99});
  EXPECT_TRUE(queue.drain().empty());
}

// -----------------------------------------------------------------------------
// 3. Items pushed after a drain() land in the next batch.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, SuccessiveDrainsDoNotOverlap) {
  queue.push(1);
  queue.push(2);
  auto first = queue.drain();

  queue.push(3);
  auto second = queue.drain();

  EXPECT_EQ(first, (std::vector<int>{1, 2}));
  EXPECT_EQ(second, (std::vector<int>{3}));
}

// -----------------------------------------------------------------------------
// 4. Telemetry events keep their alternative and payload through the queue.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueEventTest, EventVariantsPassThrough) {
  escrow::ThreadSafeQueue<escrow::Event> events;

  escrow::FundsTransferredEvent moved;
  moved.agreement_id = 3;
  moved.from = "buyer";
  moved.to = "escrow-custody";
  moved.amount = 250;
  events.push(moved);

  escrow::AgreementUpdateEvent update;
  update.agreement.id = 3;
  update.agreement.status = escrow::domain::AgreementStatus::Funded;
  update.operation = "fund";
  events.push(update);

  auto batch = events.drain();
  ASSERT_EQ(batch.size(), 2u);

  const auto* as_moved = std::get_if<escrow::FundsTransferredEvent>(&batch[0]);
  ASSERT_NE(as_moved, nullptr);
  EXPECT_EQ(as_moved->amount, 250u);
  EXPECT_EQ(as_moved->to, "escrow-custody");

  const auto* as_update = std::get_if<escrow::AgreementUpdateEvent>(&batch[1]);
  ASSERT_NE(as_update, nullptr);
  EXPECT_EQ(as_update->operation, "fund");
  EXPECT_EQ(as_update->agreement.status,
            escrow::domain::AgreementStatus::Funded);
}

// -----------------------------------------------------------------------------
// 5. Several producers, one drainer: every item arrives exactly once and each
//    producer's items keep their relative order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersSingleDrainer) {
  constexpr int kProducers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::vector<int> received;
  std::atomic<bool> producers_done{false};
  std::thread drainer([this, &received, &producers_done] {
    while (true) {
      const bool last_round = producers_done.load();
      auto batch = queue.drain();
      received.insert(received.end(), batch.begin(), batch.end());
      if (last_round) {
        break;
      }
      std::this_thread::yield();
    }
  });

  for (auto& t : producers) t.join();
  producers_done.store(true);
  drainer.join();

  ASSERT_EQ(static_cast<int>(received.size()), kTotalItems);

  std::vector<int> last_seen(kProducers, -1);
  for (int item : received) {
    int producer = item / kItemsPerProducer;
    EXPECT_GT(item, last_seen[producer]) << "Producer order broken at " << item;
    last_seen[producer] = item;
  }

  std::sort(received.begin(), received.end());
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(received[i], i) << "Missing or duplicate item at index " << i;
  }
}
