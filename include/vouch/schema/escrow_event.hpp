#pragma once
#include <vouch/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: escrow event.
// Observational records only; payload shapes are fixed for compatible
// consumers.
namespace vouch::schema {

template <uint16_t Version>
struct challenge_issued;

template <>
struct challenge_issued<1> final {
  uint16_t version{1};
  item_id_t item_id;
  bytes_t challenge;
  account_id_t buyer;
};

using challenge_issued_t = challenge_issued<1>;

template <uint16_t Version>
struct challenge_withdrawn;

template <>
struct challenge_withdrawn<1> final {
  uint16_t version{1};
  item_id_t item_id;
  account_id_t buyer;
};

using challenge_withdrawn_t = challenge_withdrawn<1>;

using escrow_event_t = std::variant<challenge_issued_t, challenge_withdrawn_t>;

template <uint16_t Version>
struct escrow_event_record;

template <>
struct escrow_event_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  escrow_event_t event;
};

using escrow_event_record_t = escrow_event_record<1>;

}  // namespace vouch::schema
