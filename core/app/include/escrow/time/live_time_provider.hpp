#pragma once

#include "escrow/time/i_time_provider.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the escrow_node executable. main() owns the instance and passes it
// to EscrowNode, which hands it on to the EscrowEngine.
//
// Thread model:
//   Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  // Current wall-clock time in milliseconds since 1970-01-01 00:00:00 UTC.
  std::int64_t now_ms() const override;
};

}  // namespace escrow
