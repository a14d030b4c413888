#include <spdlog/spdlog.h>
#include <vouch/blake3/hash.hpp>
#include <vouch/crypto/verify.hpp>
#include <vouch/rpc/authenticator.hpp>
#include <vouch/rpc/convert.hpp>
#include <vouch/schema/key/escrow_keys.hpp>

using namespace vouch::schema;

namespace vouch::rpc {

namespace {

inline constexpr auto kAccountTag = std::string_view{"vouch.account.v1"};

}  // namespace

account_id_t account_of(const public_key_t& signer) {
  auto encoder = vouch::escrow::encoder_t{};
  auto encoded = encoder.encode(signer);
  return vouch::blake3::hash(
      {make_bytes_view(kAccountTag), bytes_view_t{encoded}});
}

authenticator::authenticator(vouch::escrow::encoder_t& encoder,
                             vouch::escrow::storage_t& storage,
                             std::optional<public_key_t> admin_key)
    : encoder_{encoder}, storage_{storage} {
  if (admin_key) {
    admin_ = account_of(*admin_key);
    spdlog::info("Administrator account {}", to_hex(*admin_));
  }
}

uint64_t authenticator::next_nonce(const account_id_t& account) const {
  return storage_
             .get<uint64_t>(encoder_,
                            key::make_auth_nonce_key(encoder_, account))
             .value_or(0) +
         1;
}

std::optional<authenticator::signer_t> authenticator::parse_signer(
    const vouch::escrow::v1::Authorization& auth) {
  auto key = parse_public_key(auth.signer());
  auto signature = parse_signature(auth.signature());
  if (!key || !signature) {
    return std::nullopt;
  }
  return signer_t{.key = std::move(*key), .signature = std::move(*signature)};
}

grpc::Status authenticator::check(const signer_t& signer,
                                  const vouch::escrow::v1::Authorization& auth,
                                  const bytes_t& payload,
                                  account_id_t& caller) {
  if (!vouch::crypto::verify_signature(signer.key, signer.signature,
                                       bytes_view_t{payload})) {
    spdlog::warn("Rejected request with an invalid signature");
    return grpc::Status{grpc::StatusCode::UNAUTHENTICATED,
                        "signature does not verify"};
  }

  auto account = account_of(signer.key);
  auto scope = vouch::escrow::transaction_scope_t{storage_};
  auto expected = next_nonce(account);
  if (auth.nonce() != expected) {
    spdlog::warn("Rejected nonce {} for {}; expected {}", auth.nonce(),
                 to_hex(account), expected);
    return grpc::Status{grpc::StatusCode::UNAUTHENTICATED,
                        "nonce " + std::to_string(auth.nonce()) +
                            " is out of order; expected " +
                            std::to_string(expected)};
  }
  storage_.put(encoder_, key::make_auth_nonce_key(encoder_, account),
               expected);
  if (!scope.commit()) {
    return grpc::Status{grpc::StatusCode::ABORTED, "nonce update aborted"};
  }
  caller = account;
  return grpc::Status::OK;
}

}  // namespace vouch::rpc
