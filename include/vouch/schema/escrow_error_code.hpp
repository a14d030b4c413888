#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: escrow error code.
// Numeric values are part of the result surface and never renumbered.
namespace vouch::schema {

enum class escrow_error_code : uint32_t {
  item_reserved = 1,
  not_buyer = 2,
  nothing_reserved = 3,
  duplicate_slot = 4,
  slot_missing = 5,
  item_not_listed = 6,
  item_already_listed = 7,
  not_seller = 8,
  not_item_owner = 9,
  item_missing = 10,
  insufficient_funds = 11,
  payment_mismatch = 12,
  capability_missing = 13,
  capability_mismatch = 14,
  holding_missing = 15,
  invalid_challenge = 16,
  collaborator_failure = 17,
};

using escrow_error_mapping_t =
    std::pair<std::string_view, escrow_error_code>;

inline constexpr auto kEscrowErrorCodeMappings = std::array{
    escrow_error_mapping_t{"item_reserved", escrow_error_code::item_reserved},
    escrow_error_mapping_t{"not_buyer", escrow_error_code::not_buyer},
    escrow_error_mapping_t{"nothing_reserved",
                           escrow_error_code::nothing_reserved},
    escrow_error_mapping_t{"duplicate_slot", escrow_error_code::duplicate_slot},
    escrow_error_mapping_t{"slot_missing", escrow_error_code::slot_missing},
    escrow_error_mapping_t{"item_not_listed",
                           escrow_error_code::item_not_listed},
    escrow_error_mapping_t{"item_already_listed",
                           escrow_error_code::item_already_listed},
    escrow_error_mapping_t{"not_seller", escrow_error_code::not_seller},
    escrow_error_mapping_t{"not_item_owner", escrow_error_code::not_item_owner},
    escrow_error_mapping_t{"item_missing", escrow_error_code::item_missing},
    escrow_error_mapping_t{"insufficient_funds",
                           escrow_error_code::insufficient_funds},
    escrow_error_mapping_t{"payment_mismatch",
                           escrow_error_code::payment_mismatch},
    escrow_error_mapping_t{"capability_missing",
                           escrow_error_code::capability_missing},
    escrow_error_mapping_t{"capability_mismatch",
                           escrow_error_code::capability_mismatch},
    escrow_error_mapping_t{"holding_missing",
                           escrow_error_code::holding_missing},
    escrow_error_mapping_t{"invalid_challenge",
                           escrow_error_code::invalid_challenge},
    escrow_error_mapping_t{"collaborator_failure",
                           escrow_error_code::collaborator_failure}};

inline constexpr std::optional<escrow_error_code> try_escrow_error_code(
    const std::string_view value) {
  for (const auto& [name, code] : kEscrowErrorCodeMappings) {
    if (name == value) {
      return code;
    }
  }
  return std::nullopt;
}

inline constexpr std::string_view to_string(const escrow_error_code value) {
  for (const auto& [name, code] : kEscrowErrorCodeMappings) {
    if (code == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace vouch::schema
