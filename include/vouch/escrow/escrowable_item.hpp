#pragma once

#include <vouch/schema/primitives.hpp>
#include <concepts>

namespace vouch::escrow {

/// Anything the ledger can hold in escrow: a copyable value with a stable id
/// and an owner that can be reassigned on settlement.
template <typename Item>
concept escrowable_item = std::copyable<Item> && requires(Item item) {
  { item.item_id } -> std::convertible_to<vouch::schema::item_id_t>;
  { item.owner } -> std::convertible_to<vouch::schema::account_id_t>;
  item.owner = vouch::schema::account_id_t{};
};

}  // namespace vouch::escrow
