#include <spdlog/spdlog.h>
#include <vouch/escrow/escrow_error.hpp>
#include <vouch/rpc/convert.hpp>
#include <vouch/rpc/server.hpp>
#include <algorithm>
#include <limits>
#include <string>

using namespace vouch::rpc;
using namespace vouch::schema;

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* finish_invalid(grpc::CallbackServerContext* context,
                                         const std::string& message) {
  spdlog::debug("Rejected request: {}", message);
  return finish(context,
                grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message});
}

/// Populate `status` from an administrative ledger failure.
void fill_error(const vouch::escrow::escrow_error& error,
                const std::string_view codespace,
                pb::Status* status) {
  status->set_code(static_cast<uint32_t>(error.code()));
  status->set_log(error.what());
  status->set_codespace(std::string{codespace});
}

}  // namespace

escrow_listener::escrow_listener(escrow_engine_t& engine,
                                 vouch::escrow::journal_notifier& journal,
                                 authenticator& auth)
    : engine_{engine}, journal_{journal}, auth_{auth} {}

grpc::ServerUnaryReactor* escrow_listener::List(
    grpc::CallbackServerContext* context,
    const pb::ListRequest* request,
    pb::ListResponse* response) {
  auto item_id = parse_id(request->item_id());
  auto price = parse_amount(request->price());
  if (!item_id || !price) {
    return finish_invalid(context, "item_id and price are required");
  }
  auto seller = account_id_t{};
  if (auto status = auth_.authenticate(request->auth(), "Escrow.List", seller,
                                       *item_id, *price);
      !status.ok()) {
    return finish(context, status);
  }
  auto result = engine_.list(seller, *item_id, *price);
  fill_status(result, response->mutable_status());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* escrow_listener::Purchase(
    grpc::CallbackServerContext* context,
    const pb::PurchaseRequest* request,
    pb::PurchaseResponse* response) {
  auto item_id = parse_id(request->item_id());
  auto payment = parse_amount(request->payment());
  auto public_key = parse_public_key(request->buyer_public_key());
  if (!item_id || !payment || !public_key) {
    return finish_invalid(context,
                          "item_id, payment and buyer_public_key are required");
  }
  auto capability_id = std::optional<capability_id_t>{};
  if (!request->capability_id().empty()) {
    capability_id = parse_id(request->capability_id());
    if (!capability_id) {
      return finish_invalid(context, "capability_id must be 32 bytes");
    }
  }

  auto challenge = make_bytes(request->challenge());
  auto buyer = account_id_t{};
  if (auto status =
          auth_.authenticate(request->auth(), "Escrow.Purchase", buyer,
                             *item_id, challenge, *public_key, *payment,
                             capability_id);
      !status.ok()) {
    return finish(context, status);
  }

  auto result = engine_.purchase(buyer, *item_id, challenge, *public_key,
                                 *payment, capability_id);
  fill_status(result, response->mutable_status());
  for (const auto& event : result.events) {
    if (const auto* issued = std::get_if<challenge_issued_t>(&event)) {
      auto* wire = response->mutable_challenge_issued();
      wire->set_item_id(to_wire(issued->item_id));
      wire->set_challenge(make_string(issued->challenge));
      wire->set_buyer(to_wire(issued->buyer));
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* escrow_listener::SubmitResponse(
    grpc::CallbackServerContext* context,
    const pb::SubmitResponseRequest* request,
    pb::SubmitResponseResponse* response) {
  auto item_id = parse_id(request->item_id());
  auto signature = parse_signature(request->signature());
  if (!item_id || !signature) {
    return finish_invalid(context, "item_id and signature are required");
  }
  auto seller = account_id_t{};
  if (auto status = auth_.authenticate(request->auth(), "Escrow.SubmitResponse",
                                       seller, *item_id, *signature);
      !status.ok()) {
    return finish(context, status);
  }
  auto result = engine_.submit_response(seller, *item_id, *signature);
  fill_status(result, response->mutable_status());
  if (result.outcome) {
    std::visit(
        overloaded{[&](const vouch::escrow::settled<item_t>& settled) {
                     auto* wire = response->mutable_settled();
                     fill_item(settled.item, wire->mutable_item());
                     fill_receipt(settled.receipt, wire->mutable_receipt());
                     if (settled.capability) {
                       fill_disposition(*settled.capability,
                                        wire->mutable_capability());
                     }
                   },
                   [&](const refund_t& refund) {
                     fill_refund(refund, response->mutable_refunded());
                   }},
        *result.outcome);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* escrow_listener::Withdraw(
    grpc::CallbackServerContext* context,
    const pb::WithdrawRequest* request,
    pb::WithdrawResponse* response) {
  auto item_id = parse_id(request->item_id());
  if (!item_id) {
    return finish_invalid(context, "item_id must be 32 bytes");
  }
  auto caller = account_id_t{};
  if (auto status =
          auth_.authenticate(request->auth(), "Escrow.Withdraw", caller, *item_id);
      !status.ok()) {
    return finish(context, status);
  }
  auto result = engine_.withdraw(caller, *item_id);
  fill_status(result, response->mutable_status());
  if (result.refund) {
    fill_refund(*result.refund, response->mutable_refund());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* escrow_listener::Delist(
    grpc::CallbackServerContext* context,
    const pb::DelistRequest* request,
    pb::DelistResponse* response) {
  auto item_id = parse_id(request->item_id());
  if (!item_id) {
    return finish_invalid(context, "item_id must be 32 bytes");
  }
  auto seller = account_id_t{};
  if (auto status =
          auth_.authenticate(request->auth(), "Escrow.Delist", seller, *item_id);
      !status.ok()) {
    return finish(context, status);
  }
  auto result = engine_.delist(seller, *item_id);
  fill_status(result, response->mutable_status());
  if (result.refund) {
    fill_refund(*result.refund, response->mutable_refund());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* escrow_listener::Take(
    grpc::CallbackServerContext* context,
    const pb::TakeRequest* request,
    pb::TakeResponse* response) {
  auto item_id = parse_id(request->item_id());
  if (!item_id) {
    return finish_invalid(context, "item_id must be 32 bytes");
  }
  auto seller = account_id_t{};
  if (auto status =
          auth_.authenticate(request->auth(), "Escrow.Take", seller, *item_id);
      !status.ok()) {
    return finish(context, status);
  }
  auto result = engine_.take(seller, *item_id);
  fill_status(result, response->mutable_status());
  if (result.item) {
    fill_item(*result.item, response->mutable_item());
  }
  if (result.refund) {
    fill_refund(*result.refund, response->mutable_refund());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* escrow_listener::IsPurchasable(
    grpc::CallbackServerContext* context,
    const pb::IsPurchasableRequest* request,
    pb::IsPurchasableResponse* response) {
  auto item_id = parse_id(request->item_id());
  if (!item_id) {
    return finish_invalid(context, "item_id must be 32 bytes");
  }
  response->set_purchasable(engine_.is_purchasable(*item_id));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* escrow_listener::GetIntent(
    grpc::CallbackServerContext* context,
    const pb::GetIntentRequest* request,
    pb::GetIntentResponse* response) {
  auto item_id = parse_id(request->item_id());
  if (!item_id) {
    return finish_invalid(context, "item_id must be 32 bytes");
  }
  auto intent = engine_.pending_intent(*item_id);
  response->set_reserved(intent.has_value());
  if (intent) {
    fill_intent(*intent, response->mutable_intent());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* escrow_listener::ListEvents(
    grpc::CallbackServerContext* context,
    const pb::ListEventsRequest* request,
    pb::ListEventsResponse* response) {
  auto to = request->to_sequence() == 0 ? std::numeric_limits<uint64_t>::max()
                                        : request->to_sequence();
  if (request->from_sequence() > to) {
    return finish_invalid(context, "from_sequence exceeds to_sequence");
  }
  auto from = std::max<uint64_t>(request->from_sequence(), 1);
  auto limit = request->limit() == 0
                   ? kMaxEventPage
                   : std::min<uint64_t>(request->limit(), kMaxEventPage);
  if (to - from >= limit) {
    to = from + limit - 1;
  }
  for (const auto& record : journal_.events(from, to)) {
    fill_event(record.sequence, record.event, response->add_events());
  }
  response->set_last_sequence(journal_.last_sequence());
  return finish_ok(context);
}

ledger_listener::ledger_listener(vouch::ledger::store_ledger& ledger,
                                 authenticator& auth)
    : ledger_{ledger}, auth_{auth} {}

grpc::ServerUnaryReactor* ledger_listener::Deposit(
    grpc::CallbackServerContext* context,
    const pb::DepositRequest* request,
    pb::DepositResponse* response) {
  auto account = parse_id(request->account());
  auto amount = parse_amount(request->amount());
  if (!account || !amount) {
    return finish_invalid(context, "account and amount are required");
  }
  if (auto status = auth_.authenticate_admin(request->auth(), "Ledger.Deposit",
                                             *account, *amount);
      !status.ok()) {
    return finish(context, status);
  }
  try {
    ledger_.deposit(*account, *amount);
  } catch (const vouch::escrow::escrow_error& error) {
    fill_error(error, "vouch.deposit", response->mutable_status());
  }
  response->set_balance(to_wire(ledger_.balance(*account)));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_listener::GetBalance(
    grpc::CallbackServerContext* context,
    const pb::GetBalanceRequest* request,
    pb::GetBalanceResponse* response) {
  auto account = parse_id(request->account());
  if (!account) {
    return finish_invalid(context, "account must be 32 bytes");
  }
  response->set_balance(to_wire(ledger_.balance(*account)));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_listener::MintItem(
    grpc::CallbackServerContext* context,
    const pb::MintItemRequest* request,
    pb::MintItemResponse* response) {
  auto metadata = make_bytes(request->metadata());
  auto owner = account_id_t{};
  if (auto status =
          auth_.authenticate(request->auth(), "Ledger.MintItem", owner, metadata);
      !status.ok()) {
    return finish(context, status);
  }
  auto item_id = ledger_.mint_item(owner, metadata);
  response->set_item_id(to_wire(item_id));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_listener::GetItem(
    grpc::CallbackServerContext* context,
    const pb::GetItemRequest* request,
    pb::GetItemResponse* response) {
  auto item_id = parse_id(request->item_id());
  if (!item_id) {
    return finish_invalid(context, "item_id must be 32 bytes");
  }
  auto found = ledger_.item(*item_id);
  if (!found) {
    return finish(context,
                  grpc::Status{grpc::StatusCode::NOT_FOUND, "unknown item"});
  }
  fill_item(*found, response->mutable_item());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_listener::IssueCapability(
    grpc::CallbackServerContext* context,
    const pb::IssueCapabilityRequest* request,
    pb::IssueCapabilityResponse* response) {
  auto item_id = parse_id(request->item_id());
  auto buyer = parse_id(request->buyer());
  auto minimum_price = parse_amount(request->minimum_price());
  if (!item_id || !buyer || !minimum_price) {
    return finish_invalid(context,
                          "item_id, buyer and minimum_price are required");
  }
  auto seller = account_id_t{};
  if (auto status =
          auth_.authenticate(request->auth(), "Ledger.IssueCapability", seller,
                             *item_id, *buyer, *minimum_price);
      !status.ok()) {
    return finish(context, status);
  }
  try {
    auto capability_id =
        ledger_.issue_capability(seller, *item_id, *buyer, *minimum_price);
    response->set_capability_id(to_wire(capability_id));
  } catch (const vouch::escrow::escrow_error& error) {
    fill_error(error, "vouch.issue_capability", response->mutable_status());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_listener::GetNonce(
    grpc::CallbackServerContext* context,
    const pb::GetNonceRequest* request,
    pb::GetNonceResponse* response) {
  auto account = parse_id(request->account());
  if (!account) {
    return finish_invalid(context, "account must be 32 bytes");
  }
  response->set_next_nonce(auth_.next_nonce(*account));
  return finish_ok(context);
}
