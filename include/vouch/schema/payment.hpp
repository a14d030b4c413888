#pragma once
#include <vouch/schema/primitives.hpp>

namespace vouch::schema {

template <uint16_t Version>
struct payment;

template <>
struct payment<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using payment_t = payment<1>;

}  // namespace vouch::schema
