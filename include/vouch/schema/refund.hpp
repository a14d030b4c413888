#pragma once
#include <vouch/schema/capability_disposition.hpp>
#include <vouch/schema/primitives.hpp>
#include <optional>

namespace vouch::schema {

template <uint16_t Version>
struct refund;

template <>
struct refund<1> final {
  uint16_t version{1};
  item_id_t item_id;
  account_id_t buyer;
  amount_t amount{};
  std::optional<capability_disposition_t> capability;
};

using refund_t = refund<1>;

}  // namespace vouch::schema
