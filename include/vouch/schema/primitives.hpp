#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vouch::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using item_id_t = hash32_t;
using capability_id_t = hash32_t;
using holding_id_t = hash32_t;
using receipt_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

/// Parse a non-negative decimal amount; rejects signs, blanks and overflow.
std::optional<amount_t> try_make_amount(const std::string_view decimal);

struct ed25519_public_key final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_public_key final {
  std::array<uint8_t, 33> public_key;
};

/// Credential of a scheme the built-in verifier does not know about, e.g. a
/// succinct-proof verifying key. Only a custom verifier can accept it.
struct external_public_key final {
  hash32_t scheme_id;
  bytes_t key;
};

using public_key_t = std::variant<ed25519_public_key,
                                  secp256k1_public_key,
                                  external_public_key>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using external_proof_t = bytes_t;
using signature_t = std::variant<ed25519_signature_t,
                                 secp256k1_signature_t,
                                 external_proof_t>;

}  // namespace vouch::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
