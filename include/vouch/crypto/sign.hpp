#pragma once

#include <vouch/schema/primitives.hpp>
#include <array>
#include <cstddef>
#include <optional>

namespace vouch::crypto {

using ed25519_private_key_t = std::array<uint8_t, 32>;

struct ed25519_keypair final {
  ed25519_private_key_t private_key{};
  vouch::schema::ed25519_public_key public_key{};
};

std::optional<ed25519_keypair> generate_ed25519();

/// Derive the keypair for a raw 32-byte seed.
std::optional<ed25519_keypair> ed25519_from_seed(
    const ed25519_private_key_t& seed);

std::optional<vouch::schema::ed25519_signature_t> sign_ed25519(
    const ed25519_private_key_t& private_key,
    const vouch::schema::bytes_view_t& message);

/// Largest request `random_bytes` serves.
inline constexpr std::size_t kMaxRandomBytes = std::size_t{1} << 20;

/// Cryptographically random bytes, e.g. a fresh challenge. Returns
/// `std::nullopt` above `kMaxRandomBytes`.
std::optional<vouch::schema::bytes_t> random_bytes(std::size_t size);

}  // namespace vouch::crypto
