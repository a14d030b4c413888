#pragma once

#include <vouch/schema/primitives.hpp>
#include <functional>

namespace vouch::escrow {

/// Predicate proving a claim against a challenge. Must be pure: the engine
/// calls it exactly once per response, on the challenge stored in the intent.
using challenge_verifier_t =
    std::function<bool(const vouch::schema::public_key_t& public_key,
                       const vouch::schema::signature_t& signature,
                       const vouch::schema::bytes_view_t& message)>;

/// OpenSSL backed ed25519 / secp256k1 verifier.
challenge_verifier_t make_signature_verifier();

}  // namespace vouch::escrow
