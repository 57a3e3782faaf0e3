#include "escrow/engine/escrow_node.hpp"
#include "escrow/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace escrow {

namespace {

// Raised by the field readers below; turned into a BadRequest reply.
class BadRequest : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

std::string requireString(const nlohmann::json& request, const char* field) {
  auto it = request.find(field);
  if (it == request.end() || !it->is_string()) {
    throw BadRequest(std::string("missing or non-string field '") + field +
                     "'");
  }
  return it->get<std::string>();
}

std::uint64_t requireUnsigned(const nlohmann::json& request,
                              const char* field) {
  auto it = request.find(field);
  if (it == request.end() || !it->is_number_unsigned()) {
    throw BadRequest(std::string("missing or non-unsigned field '") + field +
                     "'");
  }
  return it->get<std::uint64_t>();
}

nlohmann::json errorReply(EscrowError error) {
  nlohmann::json reply;
  reply["status"] = "error";
  reply["error"] = to_string(error);
  reply["code"] = error_code(error);
  return reply;
}

nlohmann::json badRequestReply(const std::string& reason) {
  nlohmann::json reply;
  reply["status"] = "error";
  reply["error"] = "BadRequest";
  reply["response"] = reason;
  return reply;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: seed the ledger, then build the engine on top of it
// -----------------------------------------------------------------------------
EscrowNode::EscrowNode(const ITimeProvider& clock, NodeConfig config)
    : clock_(clock), config_(std::move(config)) {
  for (const auto& [identity, amount] : config_.genesis_balances) {
    ledger_.credit(identity, amount);
  }

  engine_ = std::make_unique<EscrowEngine>(ledger_, clock_, bus_,
                                           config_.settings);

  std::cout << "[EscrowNode] initialized. arbiter=" << engine_->arbiter()
            << " custody=" << engine_->custody_identity()
            << " genesis_accounts=" << config_.genesis_balances.size()
            << " total_supply=" << ledger_.total_supply() << "\n";
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
EscrowNode::~EscrowNode() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EscrowNode::start() {
  if (running_) {
    return;
  }

  // Skip the sockets if no endpoints were configured (unit tests drive
  // executeCommand() directly).
  if (!config_.cmd_endpoint.empty() && !config_.pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& request) { return executeCommand(request); },
        config_.cmd_endpoint, config_.pub_endpoint);
    ipc_server_->start();

    // Telemetry bridges: every committed engine event goes out on PUB.
    telemetry_subs_.push_back(bus_.subscribe<FundsTransferredEvent>(
        [this](const FundsTransferredEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
    telemetry_subs_.push_back(bus_.subscribe<AgreementUpdateEvent>(
        [this](const AgreementUpdateEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
  }

  running_ = true;

  std::cout << "[EscrowNode] started"
            << (ipc_server_ ? " with IPC server" : " without IPC server")
            << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EscrowNode::stop() {
  if (!running_) {
    return;
  }

  // Join the worker first. A command it is still serving may be inside
  // publish() with a snapshot that includes the bridges below.
  if (ipc_server_) {
    ipc_server_->stop();
  }

  for (auto id : telemetry_subs_) {
    bus_.unsubscribe(id);
  }
  telemetry_subs_.clear();

  ipc_server_.reset();

  running_ = false;

  std::cout << "[EscrowNode] stopped.\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, serialize
// -----------------------------------------------------------------------------
std::string EscrowNode::executeCommand(const std::string& request) {
  nlohmann::json response;

  try {
    nlohmann::json parsed = nlohmann::json::parse(request);
    if (!parsed.is_object()) {
      throw BadRequest("request must be a JSON object");
    }
    response = dispatch(parsed);
  } catch (const nlohmann::json::exception& e) {
    response = badRequestReply(e.what());
  } catch (const BadRequest& e) {
    response = badRequestReply(e.what());
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// dispatch(): one branch per command
// -----------------------------------------------------------------------------
nlohmann::json EscrowNode::dispatch(const nlohmann::json& request) {
  const std::string cmd = requireString(request, "cmd");
  nlohmann::json response;

  if (cmd == "ping") {
    response["status"] = "ok";
    response["response"] = "pong";
  } else if (cmd == "status") {
    response = statusReply();
  } else if (cmd == "create") {
    domain::CallContext ctx(requireString(request, "caller"));
    const std::string buyer = requireString(request, "buyer");
    const domain::Amount amount = requireUnsigned(request, "amount");
    const std::string description = requireString(request, "description");

    auto result = engine_->create_agreement(ctx, buyer, amount, description);
    if (!result) {
      return errorReply(result.error());
    }
    response["status"] = "ok";
    response["agreement_id"] = result.value();
  } else if (cmd == "fund" || cmd == "accept" || cmd == "complete" ||
             cmd == "dispute" || cmd == "refund") {
    domain::CallContext ctx(requireString(request, "caller"));
    const domain::AgreementId id = requireUnsigned(request, "agreement_id");
    response = runTransition(cmd, ctx, id);
  } else if (cmd == "get_agreement") {
    const domain::AgreementId id = requireUnsigned(request, "agreement_id");
    response["status"] = "ok";
    if (auto agreement = engine_->get_agreement(id)) {
      response["agreement"] = *agreement;
    } else {
      response["agreement"] = nullptr;
    }
  } else if (cmd == "get_escrow_balance") {
    const domain::AgreementId id = requireUnsigned(request, "agreement_id");
    response["status"] = "ok";
    if (auto balance = engine_->get_escrow_balance(id)) {
      response["escrow_balance"] = *balance;
    } else {
      response["escrow_balance"] = nullptr;
    }
  } else if (cmd == "balance") {
    const std::string identity = requireString(request, "identity");
    response["status"] = "ok";
    response["identity"] = identity;
    response["balance"] = ledger_.balance_of(identity);
  } else {
    throw BadRequest("unknown command: " + cmd);
  }

  return response;
}

nlohmann::json EscrowNode::runTransition(const std::string& cmd,
                                         const domain::CallContext& ctx,
                                         domain::AgreementId id) {
  Result<bool> result = EscrowError::NotFound;
  if (cmd == "fund") {
    result = engine_->fund_agreement(ctx, id);
  } else if (cmd == "accept") {
    result = engine_->accept_agreement(ctx, id);
  } else if (cmd == "complete") {
    result = engine_->complete_agreement(ctx, id);
  } else if (cmd == "dispute") {
    result = engine_->dispute_agreement(ctx, id);
  } else {
    result = engine_->refund_agreement(ctx, id);
  }

  if (!result) {
    return errorReply(result.error());
  }

  nlohmann::json response;
  response["status"] = "ok";
  response["result"] = result.value();
  return response;
}

nlohmann::json EscrowNode::statusReply() const {
  nlohmann::json response;
  response["status"] = "ok";
  response["running"] = running_;
  response["arbiter"] = engine_->arbiter();
  response["custody_identity"] = engine_->custody_identity();
  response["agreements"] = engine_->agreement_count();
  response["open_escrows"] = engine_->escrow_count();
  response["next_agreement_id"] = engine_->next_agreement_id();
  response["custody_balance"] =
      ledger_.balance_of(engine_->custody_identity());
  response["total_supply"] = ledger_.total_supply();
  response["requests_served"] =
      ipc_server_ ? ipc_server_->requestsServed() : 0;
  response["delivery_failures"] = bus_.deliveryFailures();
  return response;
}

}  // namespace escrow
