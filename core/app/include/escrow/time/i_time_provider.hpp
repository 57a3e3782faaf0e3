#pragma once

#include <cstdint>

namespace escrow {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// The engine reads the clock in exactly one place: to stamp an agreement's
// created_at, and the events it publishes. If it called
// std::chrono::system_clock::now() directly, tests could not assert on those
// timestamps and replays would not be reproducible.
//
// Implementations:
//   - LiveTimeProvider        → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider  → returns a value set by the test or replay.
//
// Components receive `const ITimeProvider&` and call now_ms(). They do not
// know which implementation they were given.
//
// Representation: int64_t milliseconds since the Unix epoch. The same integer
// is written into the JSON wire format without any conversion.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. Writers (e.g.
//   SimulationTimeProvider::advance_time) synchronize internally.
//
// Ownership:
//   Components hold a const reference and do not own the provider. The
//   provider must outlive every component that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // @return int64_t  Epoch milliseconds. May be 0 for a simulation clock that
  //         was never advanced.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace escrow
