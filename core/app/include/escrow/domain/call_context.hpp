#pragma once

#include "escrow/domain/agreement.hpp"

#include <utility>

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// CallContext
// -----------------------------------------------------------------------------
// Responsibility: Carries the authenticated identity of whoever invokes a
// lifecycle operation.
//
// The engine trusts `caller` as-is; authenticating it is the host's job
// (the node takes it from the command envelope, tests set it directly).
// Passed explicitly to every mutating operation so the engine never reads an
// ambient "current caller".
// -----------------------------------------------------------------------------
struct CallContext {
  Identity caller;

  explicit CallContext(Identity who) : caller(std::move(who)) {}
};

}  // namespace domain
}  // namespace escrow
