#include <spdlog/spdlog.h>
#include <vouch/crypto/verify.hpp>
#include <vouch/escrow/challenge_verifier.hpp>

namespace vouch::escrow {

challenge_verifier_t make_signature_verifier() {
  if (!vouch::crypto::available()) {
    spdlog::warn(
        "OpenSSL lacks ed25519 or secp256k1; every response will be refunded");
  }
  return [](const vouch::schema::public_key_t& public_key,
            const vouch::schema::signature_t& signature,
            const vouch::schema::bytes_view_t& message) {
    return vouch::crypto::verify_signature(public_key, signature, message);
  };
}

}  // namespace vouch::escrow
