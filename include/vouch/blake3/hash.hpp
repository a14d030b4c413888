#pragma once
#include <vouch/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace vouch::blake3 {

vouch::schema::hash32_t hash(const std::string_view& str);
vouch::schema::hash32_t hash(const vouch::schema::bytes_view_t& bytes);

/// Hash the concatenation of `parts`; used to derive ids from several fields.
vouch::schema::hash32_t hash(
    std::initializer_list<vouch::schema::bytes_view_t> parts);

}  // namespace vouch::blake3
