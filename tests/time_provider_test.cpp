// =============================================================================
// time_provider_test.cpp
// =============================================================================
// Unit tests for escrow::SimulationTimeProvider and escrow::LiveTimeProvider.
// =============================================================================

#include "escrow/time/live_time_provider.hpp"
#include "escrow/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>

// -----------------------------------------------------------------------------
// 1. Simulation time starts at 0 and reads back whatever was set.
// -----------------------------------------------------------------------------
TEST(SimulationTimeProviderTest, AdvanceTimeIsVisible) {
  escrow::SimulationTimeProvider clock;
  EXPECT_EQ(clock.now_ms(), 0);

  clock.advance_time(1'700'000'000'000);
  EXPECT_EQ(clock.now_ms(), 1'700'000'000'000);

  clock.advance_time(1'700'000'000'500);
  EXPECT_EQ(clock.now_ms(), 1'700'000'000'500);
}

// -----------------------------------------------------------------------------
// 2. Both providers work through the interface.
// -----------------------------------------------------------------------------
TEST(SimulationTimeProviderTest, UsableThroughInterface) {
  escrow::SimulationTimeProvider sim;
  sim.advance_time(12345);
  const escrow::ITimeProvider& clock = sim;
  EXPECT_EQ(clock.now_ms(), 12345);
}

// -----------------------------------------------------------------------------
// 3. Live time tracks the system clock in epoch milliseconds.
// -----------------------------------------------------------------------------
TEST(LiveTimeProviderTest, MatchesSystemClock) {
  escrow::LiveTimeProvider clock;

  auto before = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count();
  auto now = clock.now_ms();
  auto after = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();

  EXPECT_GE(now, before);
  EXPECT_LE(now, after);
}
