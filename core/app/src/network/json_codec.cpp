#include "escrow/network/json_codec.hpp"

namespace escrow {

namespace domain {

void to_json(nlohmann::json& j, const Agreement& agreement) {
  j = nlohmann::json{
      {"id", agreement.id},
      {"vendor", agreement.vendor},
      {"buyer", agreement.buyer},
      {"amount", agreement.amount},
      {"description", agreement.description},
      {"status", to_string(agreement.status)},
      {"created_at", agreement.created_at},
  };
}

void to_json(nlohmann::json& j, const EscrowBalance& balance) {
  j = nlohmann::json{
      {"agreement_id", balance.agreement_id},
      {"balance", balance.balance},
  };
}

}  // namespace domain

void to_json(nlohmann::json& j, const AgreementUpdateEvent& event) {
  j = nlohmann::json{
      {"type", "agreement_update"},
      {"operation", event.operation},
      {"caller", event.caller},
      {"previous_status", domain::to_string(event.previous_status)},
      {"timestamp_ms", event.timestamp_ms},
      {"agreement", event.agreement},
  };
}

void to_json(nlohmann::json& j, const FundsTransferredEvent& event) {
  j = nlohmann::json{
      {"type", "funds_transferred"},
      {"agreement_id", event.agreement_id},
      {"from", event.from},
      {"to", event.to},
      {"amount", event.amount},
      {"timestamp_ms", event.timestamp_ms},
  };
}

}  // namespace escrow
