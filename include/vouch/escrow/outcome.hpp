#pragma once

#include <vouch/escrow/escrowable_item.hpp>
#include <vouch/schema/capability_disposition.hpp>
#include <vouch/schema/refund.hpp>
#include <vouch/schema/transfer_receipt.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace vouch::escrow {

template <escrowable_item Item>
struct settled final {
  Item item;
  vouch::schema::transfer_receipt_t receipt;
  std::optional<vouch::schema::capability_disposition_t> capability;
};

/// A failed proof is not an error: it yields a refund.
template <escrowable_item Item>
using response_outcome_t = std::variant<settled<Item>, vouch::schema::refund_t>;

template <escrowable_item Item>
struct response_result final {
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<response_outcome_t<Item>> outcome;
};

template <escrowable_item Item>
struct take_result final {
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<Item> item;
  std::optional<vouch::schema::refund_t> refund;
};

}  // namespace vouch::escrow
