#pragma once

#include <vouch/schema/escrow_event.hpp>
#include <vouch/schema/refund.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vouch::schema {

template <uint16_t Version>
struct escrow_result;

/// Result of a protocol operation. `code` 0 means success; any other value
/// is an `escrow_error_code` and the operation had no effect.
template <>
struct escrow_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<refund_t> refund;
  std::vector<escrow_event_t> events;
};

using escrow_result_t = escrow_result<1>;

}  // namespace vouch::schema
