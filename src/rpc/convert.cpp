#include <vouch/rpc/convert.hpp>
#include <algorithm>
#include <iterator>

using namespace vouch::schema;

namespace vouch::rpc {

namespace {

template <std::size_t N>
std::optional<std::array<uint8_t, N>> parse_fixed(const std::string& value) {
  if (value.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy_n(std::begin(value), N, std::begin(out));
  return out;
}

template <std::size_t N>
std::string to_wire(const std::array<uint8_t, N>& value) {
  return std::string{std::begin(value), std::end(value)};
}

}  // namespace

std::optional<hash32_t> parse_id(const std::string& value) {
  return parse_fixed<32>(value);
}

std::optional<amount_t> parse_amount(const std::string& value) {
  return try_make_amount(value);
}

std::optional<public_key_t> parse_public_key(const pb::PublicKey& value) {
  switch (value.scheme_case()) {
    case pb::PublicKey::kEd25519: {
      auto key = parse_fixed<32>(value.ed25519());
      if (!key) {
        return std::nullopt;
      }
      return public_key_t{ed25519_public_key{.public_key = *key}};
    }
    case pb::PublicKey::kSecp256K1: {
      auto key = parse_fixed<33>(value.secp256k1());
      if (!key) {
        return std::nullopt;
      }
      return public_key_t{secp256k1_public_key{.public_key = *key}};
    }
    case pb::PublicKey::kExternal: {
      auto scheme = parse_id(value.external().scheme_id());
      if (!scheme) {
        return std::nullopt;
      }
      return public_key_t{external_public_key{
          .scheme_id = *scheme, .key = make_bytes(value.external().key())}};
    }
    case pb::PublicKey::SCHEME_NOT_SET:
    default:
      return std::nullopt;
  }
}

std::optional<signature_t> parse_signature(const pb::Signature& value) {
  switch (value.scheme_case()) {
    case pb::Signature::kEd25519: {
      auto signature = parse_fixed<64>(value.ed25519());
      if (!signature) {
        return std::nullopt;
      }
      return signature_t{*signature};
    }
    case pb::Signature::kSecp256K1: {
      auto signature = parse_fixed<65>(value.secp256k1());
      if (!signature) {
        return std::nullopt;
      }
      return signature_t{*signature};
    }
    case pb::Signature::kExternal:
      return signature_t{
          std::in_place_type<external_proof_t>,
          make_bytes(value.external())};
    case pb::Signature::SCHEME_NOT_SET:
    default:
      return std::nullopt;
  }
}

std::string to_wire(const hash32_t& id) {
  return to_wire<32>(id);
}

std::string to_wire(const amount_t& amount) {
  return amount.str();
}

void fill_public_key(const public_key_t& key, pb::PublicKey* out) {
  std::visit(overloaded{[&](const ed25519_public_key& value) {
                          out->set_ed25519(to_wire(value.public_key));
                        },
                        [&](const secp256k1_public_key& value) {
                          out->set_secp256k1(to_wire(value.public_key));
                        },
                        [&](const external_public_key& value) {
                          auto* external = out->mutable_external();
                          external->set_scheme_id(to_wire(value.scheme_id));
                          external->set_key(make_string(value.key));
                        }},
             key);
}

void fill_disposition(const capability_disposition_t& value,
                      pb::CapabilityDisposition* out) {
  std::visit(overloaded{[&](const consumed_by_settlement& consumed) {
                          out->set_capability_id(
                              to_wire(consumed.capability_id));
                          out->set_consumed_by_settlement(true);
                        },
                        [&](const returned_to_buyer& returned) {
                          out->set_capability_id(
                              to_wire(returned.capability_id));
                          out->set_returned_to_buyer(to_wire(returned.buyer));
                        }},
             value);
}

void fill_refund(const refund_t& refund, pb::Refund* out) {
  out->set_item_id(to_wire(refund.item_id));
  out->set_buyer(to_wire(refund.buyer));
  out->set_amount(to_wire(refund.amount));
  if (refund.capability) {
    fill_disposition(*refund.capability, out->mutable_capability());
  }
}

void fill_item(const item_t& item, pb::Item* out) {
  out->set_item_id(to_wire(item.item_id));
  out->set_owner(to_wire(item.owner));
  out->set_metadata(make_string(item.metadata));
}

void fill_receipt(const transfer_receipt_t& receipt,
                  pb::TransferReceipt* out) {
  out->set_receipt_id(to_wire(receipt.receipt_id));
  out->set_item_id(to_wire(receipt.item_id));
  out->set_seller(to_wire(receipt.seller));
  out->set_buyer(to_wire(receipt.buyer));
  out->set_amount(to_wire(receipt.amount));
}

void fill_intent(const purchase_intent_t& intent, pb::PurchaseIntent* out) {
  out->set_item_id(to_wire(intent.item_id));
  out->set_challenge(make_string(intent.challenge));
  fill_public_key(intent.buyer_public_key, out->mutable_buyer_public_key());
  out->set_holding_id(to_wire(intent.escrowed_funds.holding_id));
  out->set_amount(to_wire(intent.escrowed_funds.amount));
  out->set_buyer(to_wire(intent.buyer));
  if (intent.exclusive_capability) {
    out->set_capability_id(
        to_wire(intent.exclusive_capability->capability_id));
  }
}

void fill_event(const uint64_t sequence,
                const escrow_event_t& event,
                pb::EscrowEvent* out) {
  out->set_sequence(sequence);
  std::visit(overloaded{[&](const challenge_issued_t& issued) {
                          auto* wire = out->mutable_challenge_issued();
                          wire->set_item_id(to_wire(issued.item_id));
                          wire->set_challenge(make_string(issued.challenge));
                          wire->set_buyer(to_wire(issued.buyer));
                        },
                        [&](const challenge_withdrawn_t& withdrawn) {
                          auto* wire = out->mutable_challenge_withdrawn();
                          wire->set_item_id(to_wire(withdrawn.item_id));
                          wire->set_buyer(to_wire(withdrawn.buyer));
                        }},
             event);
}

}  // namespace vouch::rpc
