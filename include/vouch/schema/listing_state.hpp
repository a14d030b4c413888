#pragma once
#include <vouch/schema/primitives.hpp>

namespace vouch::schema {

template <uint16_t Version>
struct listing_state;

template <>
struct listing_state<1> final {
  uint16_t version{1};
  item_id_t item_id;
  account_id_t seller;
  amount_t price{};
};

using listing_state_t = listing_state<1>;

}  // namespace vouch::schema
