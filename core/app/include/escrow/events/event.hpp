#pragma once

#include "escrow/events/agreement_update_event.hpp"
#include "escrow/events/funds_transferred_event.hpp"

#include <variant>

namespace escrow {

// -----------------------------------------------------------------------------
// Event: closed set of everything the EventBus can carry
// -----------------------------------------------------------------------------
//
// @details
// A std::variant instead of a base class with virtual dispatch: events stay
// plain value types, subscribers select their alternative with
// std::get_if, and adding an alternative is a compile-time change visible to
// every std::visit.
// -----------------------------------------------------------------------------
using Event = std::variant<
    AgreementUpdateEvent,
    FundsTransferredEvent>;

}  // namespace escrow
