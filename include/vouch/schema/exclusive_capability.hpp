#pragma once
#include <vouch/schema/primitives.hpp>

// Schema type: exclusive purchase capability.
// Seller-issued right letting one holder buy a listed item at or above
// `minimum_price`, bypassing the listed-price check.
namespace vouch::schema {

template <uint16_t Version>
struct exclusive_capability;

template <>
struct exclusive_capability<1> final {
  uint16_t version{1};
  capability_id_t capability_id;
  item_id_t item_id;
  account_id_t issuer;
  account_id_t holder;
  amount_t minimum_price{};
};

using exclusive_capability_t = exclusive_capability<1>;

}  // namespace vouch::schema
