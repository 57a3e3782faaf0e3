#pragma once

#include "escrow/domain/agreement.hpp"
#include "escrow/events/agreement_update_event.hpp"
#include "escrow/events/funds_transferred_event.hpp"

#include <nlohmann/json.hpp>

namespace escrow {

// -----------------------------------------------------------------------------
// JSON wire format
// -----------------------------------------------------------------------------
//
// @details
// nlohmann/json ADL hooks, so callers can write `nlohmann::json j = agreement;`.
// Serialization only; the node parses requests field by field because each
// command takes a different set of arguments.
//
//   Agreement             {"id","vendor","buyer","amount","description",
//                          "status","created_at"}
//   EscrowBalance         {"agreement_id","balance"}
//   AgreementUpdateEvent  {"type":"agreement_update","operation","caller",
//                          "previous_status","timestamp_ms","agreement":{..}}
//   FundsTransferredEvent {"type":"funds_transferred","agreement_id","from",
//                          "to","amount","timestamp_ms"}
//
// Statuses are written by name ("Pending", "Funded", ...).
// -----------------------------------------------------------------------------
namespace domain {

void to_json(nlohmann::json& j, const Agreement& agreement);
void to_json(nlohmann::json& j, const EscrowBalance& balance);

}  // namespace domain

void to_json(nlohmann::json& j, const AgreementUpdateEvent& event);
void to_json(nlohmann::json& j, const FundsTransferredEvent& event);

}  // namespace escrow
