#pragma once
#include <vouch/schema/purchase_intent.hpp>
#include <optional>

namespace vouch::schema {

template <uint16_t Version>
struct escrow_slot;

/// Empty slot: item purchasable. Occupied slot: item reserved.
template <>
struct escrow_slot<1> final {
  uint16_t version{1};
  item_id_t item_id;
  std::optional<purchase_intent_t> intent;
};

using escrow_slot_t = escrow_slot<1>;

}  // namespace vouch::schema
