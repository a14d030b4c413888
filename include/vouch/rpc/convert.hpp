#pragma once

#include <vouch/escrow/v1/escrow.pb.h>
#include <vouch/schema/escrow_event.hpp>
#include <vouch/schema/escrow_result.hpp>
#include <vouch/schema/item.hpp>
#include <vouch/schema/primitives.hpp>
#include <vouch/schema/purchase_intent.hpp>
#include <vouch/schema/refund.hpp>
#include <vouch/schema/transfer_receipt.hpp>
#include <optional>
#include <string>

// Wire <-> schema mapping for the gRPC surface. Parsers return std::nullopt
// on malformed input; callers answer with INVALID_ARGUMENT.
namespace vouch::rpc {

namespace pb = vouch::escrow::v1;

std::optional<vouch::schema::hash32_t> parse_id(const std::string& value);
std::optional<vouch::schema::amount_t> parse_amount(const std::string& value);
std::optional<vouch::schema::public_key_t> parse_public_key(
    const pb::PublicKey& value);
std::optional<vouch::schema::signature_t> parse_signature(
    const pb::Signature& value);

std::string to_wire(const vouch::schema::hash32_t& id);
std::string to_wire(const vouch::schema::amount_t& amount);

template <typename Result>
void fill_status(const Result& result, pb::Status* status) {
  status->set_code(result.code);
  status->set_log(result.log);
  status->set_codespace(result.codespace);
}

void fill_public_key(const vouch::schema::public_key_t& key,
                     pb::PublicKey* out);
void fill_disposition(const vouch::schema::capability_disposition_t& value,
                      pb::CapabilityDisposition* out);
void fill_refund(const vouch::schema::refund_t& refund, pb::Refund* out);
void fill_item(const vouch::schema::item_t& item, pb::Item* out);
void fill_receipt(const vouch::schema::transfer_receipt_t& receipt,
                  pb::TransferReceipt* out);
void fill_intent(const vouch::schema::purchase_intent_t& intent,
                 pb::PurchaseIntent* out);
void fill_event(uint64_t sequence,
                const vouch::schema::escrow_event_t& event,
                pb::EscrowEvent* out);

}  // namespace vouch::rpc
