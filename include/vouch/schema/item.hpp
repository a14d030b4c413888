#pragma once
#include <vouch/schema/primitives.hpp>

// Schema type: item.
// Reference ledger asset: a uniquely identified, ownership-transferable item.
namespace vouch::schema {

template <uint16_t Version>
struct item;

template <>
struct item<1> final {
  uint16_t version{1};
  item_id_t item_id;
  account_id_t owner;
  bytes_t metadata;
};

using item_t = item<1>;

}  // namespace vouch::schema
