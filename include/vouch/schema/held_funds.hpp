#pragma once
#include <vouch/schema/primitives.hpp>

// Schema type: held funds.
// Balance moved out of the depositor's control and held by the escrow until
// it is released back or forwarded into a purchase.
namespace vouch::schema {

template <uint16_t Version>
struct held_funds;

template <>
struct held_funds<1> final {
  uint16_t version{1};
  holding_id_t holding_id;
  account_id_t depositor;
  amount_t amount{};
};

using held_funds_t = held_funds<1>;

}  // namespace vouch::schema
