#pragma once
#include <vouch/schema/exclusive_capability.hpp>
#include <vouch/schema/held_funds.hpp>
#include <vouch/schema/primitives.hpp>
#include <optional>

// Schema type: purchase intent.
// Pending reservation of one item. Owned by the item's escrow slot until it
// is settled, refunded or withdrawn.
namespace vouch::schema {

template <uint16_t Version>
struct purchase_intent;

template <>
struct purchase_intent<1> final {
  uint16_t version{1};
  item_id_t item_id;
  bytes_t challenge;
  public_key_t buyer_public_key;
  held_funds_t escrowed_funds;
  account_id_t buyer;
  std::optional<exclusive_capability_t> exclusive_capability;
};

using purchase_intent_t = purchase_intent<1>;

}  // namespace vouch::schema
