#pragma once

#include <vouch/schema/primitives.hpp>

namespace vouch::crypto {

bool available();

/// Check `signature` over `message` under `public_key`. Mismatched schemes
/// and external credentials are never accepted here.
bool verify_signature(const vouch::schema::public_key_t& public_key,
                      const vouch::schema::signature_t& signature,
                      const vouch::schema::bytes_view_t& message);

}  // namespace vouch::crypto
