#pragma once

#include <grpcpp/support/status.h>
#include <vouch/escrow/backend.hpp>
#include <vouch/escrow/v1/escrow.pb.h>
#include <vouch/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace vouch::rpc {

inline constexpr auto kSigningDomain = std::string_view{"vouch.v1"};

/// Account a signing key acts as.
vouch::schema::account_id_t account_of(
    const vouch::schema::public_key_t& signer);

/// Bytes the signer of `method` commits to: the domain, the method, the
/// nonce and the call's arguments, SCALE encoded in that order.
template <typename... Args>
vouch::schema::bytes_t make_signing_payload(const std::string_view method,
                                            const uint64_t nonce,
                                            const Args&... args) {
  auto encoder = vouch::escrow::encoder_t{};
  return encoder.encode(std::tuple{std::string{kSigningDomain},
                                   std::string{method}, nonce, args...});
}

/// Resolves the acting account of a request from its `Authorization`.
///
/// The signature must verify under the signer over the call's signing
/// payload, and the nonce must be exactly one above the last accepted nonce
/// of that account. An accepted nonce is consumed even when the call it
/// authorized later fails.
class authenticator final {
 public:
  authenticator(vouch::escrow::encoder_t& encoder,
                vouch::escrow::storage_t& storage,
                std::optional<vouch::schema::public_key_t> admin_key =
                    std::nullopt);

  /// INVALID_ARGUMENT for a malformed authorization, UNAUTHENTICATED for a
  /// bad signature or an out of order nonce. On success `caller` holds the
  /// signer's account.
  template <typename... Args>
  grpc::Status authenticate(const vouch::escrow::v1::Authorization& auth,
                            const std::string_view method,
                            vouch::schema::account_id_t& caller,
                            const Args&... args) {
    auto signer = parse_signer(auth);
    if (!signer) {
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                          "auth.signer and auth.signature are required"};
    }
    return check(*signer, auth,
                 make_signing_payload(method, auth.nonce(), args...), caller);
  }

  /// Like `authenticate`, and the signer must be the administrator.
  /// PERMISSION_DENIED otherwise, or when none is configured.
  template <typename... Args>
  grpc::Status authenticate_admin(const vouch::escrow::v1::Authorization& auth,
                                  const std::string_view method,
                                  const Args&... args) {
    if (!admin_) {
      return grpc::Status{grpc::StatusCode::PERMISSION_DENIED,
                          "no administrator is configured"};
    }
    auto caller = vouch::schema::account_id_t{};
    auto status = authenticate(auth, method, caller, args...);
    if (!status.ok()) {
      return status;
    }
    if (caller != *admin_) {
      return grpc::Status{grpc::StatusCode::PERMISSION_DENIED,
                          "caller is not the administrator"};
    }
    return grpc::Status::OK;
  }

  /// Nonce the account's next request must carry.
  uint64_t next_nonce(const vouch::schema::account_id_t& account) const;

 private:
  struct signer_t final {
    vouch::schema::public_key_t key;
    vouch::schema::signature_t signature;
  };

  static std::optional<signer_t> parse_signer(
      const vouch::escrow::v1::Authorization& auth);

  grpc::Status check(const signer_t& signer,
                     const vouch::escrow::v1::Authorization& auth,
                     const vouch::schema::bytes_t& payload,
                     vouch::schema::account_id_t& caller);

  vouch::escrow::encoder_t& encoder_;
  vouch::escrow::storage_t& storage_;
  std::optional<vouch::schema::account_id_t> admin_;
};

}  // namespace vouch::rpc
