#include <vouch/crypto/sign.hpp>

#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include "openssl_types.hpp"

namespace vouch::crypto {

namespace {

using namespace vouch::crypto::detail;

std::optional<ed25519_keypair> keypair_from(EVP_PKEY* key) {
  auto pair = ed25519_keypair{};
  auto private_size = pair.private_key.size();
  auto public_size = pair.public_key.public_key.size();
  if (EVP_PKEY_get_raw_private_key(key, pair.private_key.data(),
                                   &private_size) != 1 ||
      EVP_PKEY_get_raw_public_key(key, pair.public_key.public_key.data(),
                                  &public_size) != 1) {
    return std::nullopt;
  }
  if (private_size != pair.private_key.size() ||
      public_size != pair.public_key.public_key.size()) {
    return std::nullopt;
  }
  return pair;
}

evp_pkey_ptr make_private_key(const ed25519_private_key_t& seed) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(),
                                   seed.size()),
      EVP_PKEY_free};
}

}  // namespace

std::optional<ed25519_keypair> generate_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    spdlog::error("ed25519 key generation is unavailable");
    return std::nullopt;
  }
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    spdlog::error("ed25519 key generation failed");
    return std::nullopt;
  }
  auto key = evp_pkey_ptr{raw, EVP_PKEY_free};
  return keypair_from(key.get());
}

std::optional<ed25519_keypair> ed25519_from_seed(
    const ed25519_private_key_t& seed) {
  auto key = make_private_key(seed);
  if (!key) {
    return std::nullopt;
  }
  return keypair_from(key.get());
}

std::optional<vouch::schema::ed25519_signature_t> sign_ed25519(
    const ed25519_private_key_t& private_key,
    const vouch::schema::bytes_view_t& message) {
  auto key = make_private_key(private_key);
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!key || !ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = vouch::schema::ed25519_signature_t{};
  auto size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size()) != 1 ||
      size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

std::optional<vouch::schema::bytes_t> random_bytes(const std::size_t size) {
  if (size > kMaxRandomBytes) {
    spdlog::error("Refusing to generate {} random bytes", size);
    return std::nullopt;
  }
  auto out = vouch::schema::bytes_t(size);
  if (size > 0 && RAND_bytes(out.data(), static_cast<int>(size)) != 1) {
    spdlog::error("RAND_bytes failed");
    return std::nullopt;
  }
  return out;
}

}  // namespace vouch::crypto
