#pragma once

#include <vouch/escrow/v1/escrow.grpc.pb.h>
#include <vouch/escrow/engine.hpp>
#include <vouch/escrow/event_notifier.hpp>
#include <vouch/ledger/store_ledger.hpp>
#include <vouch/rpc/authenticator.hpp>
#include <vouch/schema/item.hpp>
#include <cstdint>

namespace vouch::rpc {

using escrow_engine_t = vouch::escrow::engine<vouch::schema::item_t>;

/// Upper bound on the events one `ListEvents` call returns.
inline constexpr uint64_t kMaxEventPage = 256;

/// gRPC front of the escrow engine.
///
/// Malformed identifiers, amounts, keys or signatures are rejected with
/// INVALID_ARGUMENT before the engine is touched. The caller of a mutating
/// call is the account of its authorization signer, never a field the client
/// names. Protocol failures travel back with gRPC OK and a populated `Status`
/// message.
struct escrow_listener final : public vouch::escrow::v1::Escrow::CallbackService {
  escrow_listener(escrow_engine_t& engine,
                  vouch::escrow::journal_notifier& journal,
                  authenticator& auth);

  virtual grpc::ServerUnaryReactor* List(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::ListRequest* request,
      vouch::escrow::v1::ListResponse* response) override final;

  /// Reserve an item; answers with the `ChallengeIssued` event on success.
  virtual grpc::ServerUnaryReactor* Purchase(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::PurchaseRequest* request,
      vouch::escrow::v1::PurchaseResponse* response) override final;

  /// Settles or refunds; a refund is a successful call.
  virtual grpc::ServerUnaryReactor* SubmitResponse(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::SubmitResponseRequest* request,
      vouch::escrow::v1::SubmitResponseResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Withdraw(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::WithdrawRequest* request,
      vouch::escrow::v1::WithdrawResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Delist(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::DelistRequest* request,
      vouch::escrow::v1::DelistResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Take(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::TakeRequest* request,
      vouch::escrow::v1::TakeResponse* response) override final;

  virtual grpc::ServerUnaryReactor* IsPurchasable(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::IsPurchasableRequest* request,
      vouch::escrow::v1::IsPurchasableResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetIntent(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::GetIntentRequest* request,
      vouch::escrow::v1::GetIntentResponse* response) override final;

  /// Journal entries in the inclusive range, at most `kMaxEventPage` of them;
  /// a zero upper bound means "up to the latest".
  virtual grpc::ServerUnaryReactor* ListEvents(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::ListEventsRequest* request,
      vouch::escrow::v1::ListEventsResponse* response) override final;

  escrow_engine_t& engine_;
  vouch::escrow::journal_notifier& journal_;
  authenticator& auth_;
};

/// gRPC front of the reference ledger's administrative surface. Deposits
/// are reserved to the administrator.
struct ledger_listener final : public vouch::escrow::v1::Ledger::CallbackService {
  ledger_listener(vouch::ledger::store_ledger& ledger, authenticator& auth);

  virtual grpc::ServerUnaryReactor* Deposit(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::DepositRequest* request,
      vouch::escrow::v1::DepositResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetBalance(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::GetBalanceRequest* request,
      vouch::escrow::v1::GetBalanceResponse* response) override final;

  virtual grpc::ServerUnaryReactor* MintItem(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::MintItemRequest* request,
      vouch::escrow::v1::MintItemResponse* response) override final;

  /// NOT_FOUND for an unknown item.
  virtual grpc::ServerUnaryReactor* GetItem(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::GetItemRequest* request,
      vouch::escrow::v1::GetItemResponse* response) override final;

  virtual grpc::ServerUnaryReactor* IssueCapability(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::IssueCapabilityRequest* request,
      vouch::escrow::v1::IssueCapabilityResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetNonce(
      grpc::CallbackServerContext* context,
      const vouch::escrow::v1::GetNonceRequest* request,
      vouch::escrow::v1::GetNonceResponse* response) override final;

  vouch::ledger::store_ledger& ledger_;
  authenticator& auth_;
};

}  // namespace vouch::rpc
