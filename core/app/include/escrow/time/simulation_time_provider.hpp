#pragma once

#include "escrow/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace escrow {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly with
//         advance_time() instead of being read from the system clock.
//
// @details
// Tests use it to pin created_at to known values:
//
//   SimulationTimeProvider clock;
//   clock.advance_time(1'700'000'000'000);
//   engine.create_agreement(...);   // created_at == 1700000000000
//
// It starts at 0 ("never advanced").
//
// Internal storage is a std::atomic<int64_t>, so a writer on one thread and
// readers on other threads need no extra locking.
//
// Ownership:
//   Created by the test fixture (or a replay harness) and passed by reference
//   to the components under test.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // Returns the last value passed to advance_time(), or 0.
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given epoch milliseconds.
  //
  // @details
  // Monotonicity is not enforced; tests may set any value, including one
  // earlier than the current time.
  //
  // Thread-safety: Safe to call from any thread (atomic store).
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace escrow
