#pragma once
#include <vouch/schema/primitives.hpp>
#include <variant>

// Schema type: capability disposition.
// What happened to the exclusive capability carried by a destroyed intent.
// There is deliberately no "dropped" alternative.
namespace vouch::schema {

struct consumed_by_settlement final {
  capability_id_t capability_id;
};

struct returned_to_buyer final {
  capability_id_t capability_id;
  account_id_t buyer;
};

using capability_disposition_t =
    std::variant<consumed_by_settlement, returned_to_buyer>;

}  // namespace vouch::schema
