#pragma once
#include <vouch/schema/primitives.hpp>

namespace vouch::schema {

template <uint16_t Version>
struct transfer_receipt;

template <>
struct transfer_receipt<1> final {
  uint16_t version{1};
  receipt_id_t receipt_id;
  item_id_t item_id;
  account_id_t seller;
  account_id_t buyer;
  amount_t amount{};
};

using transfer_receipt_t = transfer_receipt<1>;

}  // namespace vouch::schema
