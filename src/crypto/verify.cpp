#include <vouch/crypto/verify.hpp>

#include <openssl/core_names.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <optional>
#include <vector>

#include "openssl_types.hpp"

namespace vouch::crypto {

namespace {

using namespace vouch::crypto::detail;

bool openssl_has(const int id) {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(id, nullptr),
                              EVP_PKEY_CTX_free};
  return ctx != nullptr;
}

bool openssl_has(const char* name) {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_from_name(nullptr, name, nullptr),
                              EVP_PKEY_CTX_free};
  return ctx != nullptr;
}

/// One-shot EVP verification; `digest` is null for pure schemes.
bool digest_verify(EVP_PKEY* key,
                   const EVP_MD* digest,
                   const uint8_t* signature,
                   const std::size_t signature_size,
                   const vouch::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, key) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature, signature_size, message.data(),
                          message.size()) == 1;
}

bool verify_ed25519(const vouch::schema::ed25519_public_key& public_key,
                    const vouch::schema::ed25519_signature_t& signature,
                    const vouch::schema::bytes_view_t& message) {
  auto key =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               public_key.public_key.data(),
                                               public_key.public_key.size()),
                   EVP_PKEY_free};
  if (!key) {
    return false;
  }
  return digest_verify(key.get(), nullptr, signature.data(), signature.size(),
                       message);
}

/// Accepts [v || r || s] and [r || s || v]; v is a recovery id in 0..3 or the
/// legacy 27+ form. Returns compact [r || s].
std::optional<std::array<uint8_t, 64>> compact_secp256k1(
    const vouch::schema::secp256k1_signature_t& signature) {
  auto is_recovery_id = [](const uint8_t v) { return v <= 3 || v >= 27; };
  auto out = std::array<uint8_t, 64>{};
  if (is_recovery_id(signature.front())) {
    std::copy_n(std::next(signature.begin()), out.size(), out.begin());
    return out;
  }
  if (is_recovery_id(signature.back())) {
    std::copy_n(signature.begin(), out.size(), out.begin());
    return out;
  }
  return std::nullopt;
}

evp_pkey_ptr make_secp256k1_key(
    const vouch::schema::secp256k1_public_key& public_key) {
  auto none = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return none;
  }
  auto* group = const_cast<char*>("secp256k1");
  auto params = std::array{
      OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group, 0),
      OSSL_PARAM_construct_octet_string(
          OSSL_PKEY_PARAM_PUB_KEY,
          const_cast<unsigned char*>(public_key.public_key.data()),
          public_key.public_key.size()),
      OSSL_PARAM_construct_end()};
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params.data()) !=
      1) {
    return none;
  }
  return evp_pkey_ptr{raw, EVP_PKEY_free};
}

std::optional<std::vector<uint8_t>> to_der(
    const std::array<uint8_t, 64>& compact) {
  auto sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!sig || !r || !s) {
    return std::nullopt;
  }
  if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // Owned by `sig` from here on.
  r.release();
  s.release();

  auto size = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (size <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<std::size_t>(size));
  auto* cursor = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &cursor) != size) {
    return std::nullopt;
  }
  return der;
}

bool verify_secp256k1(const vouch::schema::secp256k1_public_key& public_key,
                      const vouch::schema::secp256k1_signature_t& signature,
                      const vouch::schema::bytes_view_t& message) {
  auto compact = compact_secp256k1(signature);
  if (!compact) {
    return false;
  }
  auto key = make_secp256k1_key(public_key);
  if (!key) {
    return false;
  }
  auto der = to_der(*compact);
  if (!der) {
    return false;
  }
  return digest_verify(key.get(), EVP_sha256(), der->data(), der->size(),
                       message);
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has(EVP_PKEY_ED25519) && openssl_has("EC");
  return available_now;
}

bool verify_signature(const vouch::schema::public_key_t& public_key,
                      const vouch::schema::signature_t& signature,
                      const vouch::schema::bytes_view_t& message) {
  return std::visit(
      overloaded{
          [&](const vouch::schema::ed25519_public_key& key) {
            const auto* sig =
                std::get_if<vouch::schema::ed25519_signature_t>(&signature);
            return sig != nullptr && verify_ed25519(key, *sig, message);
          },
          [&](const vouch::schema::secp256k1_public_key& key) {
            const auto* sig =
                std::get_if<vouch::schema::secp256k1_signature_t>(&signature);
            return sig != nullptr && verify_secp256k1(key, *sig, message);
          },
          [&](const vouch::schema::external_public_key& key) {
            spdlog::debug("No built-in verifier for external scheme {}",
                          vouch::schema::to_hex(key.scheme_id));
            return false;
          }},
      public_key);
}

}  // namespace vouch::crypto
