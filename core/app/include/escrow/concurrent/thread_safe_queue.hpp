#pragma once

#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>: multi-producer hand-off drained in batches
// -----------------------------------------------------------------------------
//
// @brief  Carries telemetry events from whichever thread publishes on the
//         EventBus to the IPC worker that writes them to the PUB socket.
//
// @details
// Producers push() one item at a time. The single consumer never waits on the
// queue: between command polls it calls drain(), which takes everything
// queued so far in one lock acquisition and hands it back in push order.
// Serialization and socket sends then happen without the lock held, so a
// slow PUB send never blocks the engine thread that is publishing.
//
// Thread model:
//   Any number of producers. drain() may be called from any thread; items
//   pushed by one producer come out in the order that producer pushed them.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    std::lock_guard lock(mutex_);
    pending_.push_back(std::move(value));
  }

  // Removes and returns every queued item, oldest first. Empty if nothing
  // was pushed since the last drain().
  std::vector<T> drain() {
    std::deque<T> taken;
    {
      std::lock_guard lock(mutex_);
      taken.swap(pending_);
    }
    return std::vector<T>(std::make_move_iterator(taken.begin()),
                          std::make_move_iterator(taken.end()));
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::deque<T> pending_;
};

}  // namespace escrow
