#include <gtest/gtest.h>
#include <vouch/crypto/verify.hpp>
#include <vouch/rpc/authenticator.hpp>
#include <vouch/testing/authorization.hpp>
#include <vouch/testing/escrow_fixture.hpp>

#include <optional>

namespace {

using vouch::schema::amount_t;
using vouch::testing::make_authorization;

class authenticator_test : public ::testing::Test {
 protected:
  authenticator_test() : fixture_{"vouch_auth"} {}

  void SetUp() override {
    if (!vouch::crypto::available()) {
      GTEST_SKIP() << "OpenSSL backend does not expose required crypto "
                      "providers";
    }
    seller_ = vouch::testing::make_keypair(0x5A);
    buyer_ = vouch::testing::make_keypair(0x6B);
    ASSERT_TRUE(seller_.has_value());
    ASSERT_TRUE(buyer_.has_value());
  }

  vouch::rpc::authenticator make_authenticator(
      std::optional<vouch::schema::public_key_t> admin = std::nullopt) {
    return vouch::rpc::authenticator{fixture_.encoder(), fixture_.storage(),
                                     std::move(admin)};
  }

  const vouch::schema::item_id_t item_ = vouch::testing::make_hash(0x42);
  vouch::testing::escrow_fixture fixture_;
  std::optional<vouch::crypto::ed25519_keypair> seller_;
  std::optional<vouch::crypto::ed25519_keypair> buyer_;
};

}  // namespace

TEST(account_of, is_bound_to_the_key) {
  auto a = vouch::schema::ed25519_public_key{};
  a.public_key.fill(0x01);
  auto b = vouch::schema::ed25519_public_key{};
  b.public_key.fill(0x02);
  EXPECT_EQ(vouch::rpc::account_of(a), vouch::rpc::account_of(a));
  EXPECT_NE(vouch::rpc::account_of(a), vouch::rpc::account_of(b));
}

TEST_F(authenticator_test, signed_call_resolves_the_signer_and_consumes_nonce) {
  auto auth = make_authenticator();
  auto account = vouch::testing::account_of(*seller_);
  ASSERT_EQ(auth.next_nonce(account), 1u);

  auto request = make_authorization(*seller_, "Escrow.List", 1, item_,
                                    amount_t{100});
  auto caller = vouch::schema::account_id_t{};
  auto status =
      auth.authenticate(request, "Escrow.List", caller, item_, amount_t{100});
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(caller, account);
  EXPECT_EQ(auth.next_nonce(account), 2u);

  // The same request a second time is a replay.
  auto again = vouch::schema::account_id_t{};
  auto replay =
      auth.authenticate(request, "Escrow.List", again, item_, amount_t{100});
  EXPECT_EQ(replay.error_code(), grpc::StatusCode::UNAUTHENTICATED);
  EXPECT_EQ(auth.next_nonce(account), 2u);
}

TEST_F(authenticator_test, forged_signer_is_rejected) {
  auto auth = make_authenticator();
  // Claims to be the seller but is signed with the buyer's key.
  auto request = make_authorization(*seller_, *buyer_, "Escrow.Delist", 1,
                                    item_);
  auto caller = vouch::schema::account_id_t{};
  auto status = auth.authenticate(request, "Escrow.Delist", caller, item_);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
  EXPECT_EQ(auth.next_nonce(vouch::testing::account_of(*seller_)), 1u);
}

TEST_F(authenticator_test, signature_covers_method_and_arguments) {
  auto auth = make_authenticator();
  auto caller = vouch::schema::account_id_t{};

  auto listed = make_authorization(*seller_, "Escrow.List", 1, item_,
                                   amount_t{100});
  EXPECT_EQ(
      auth.authenticate(listed, "Escrow.List", caller, item_, amount_t{1})
          .error_code(),
      grpc::StatusCode::UNAUTHENTICATED);

  auto delist = make_authorization(*seller_, "Escrow.Delist", 1, item_);
  EXPECT_EQ(auth.authenticate(delist, "Escrow.Take", caller, item_)
                .error_code(),
            grpc::StatusCode::UNAUTHENTICATED);

  EXPECT_EQ(auth.next_nonce(vouch::testing::account_of(*seller_)), 1u);
}

TEST_F(authenticator_test, nonces_must_be_sequential) {
  auto auth = make_authenticator();
  auto caller = vouch::schema::account_id_t{};
  auto skipped = make_authorization(*buyer_, "Escrow.Withdraw", 3, item_);
  EXPECT_EQ(auth.authenticate(skipped, "Escrow.Withdraw", caller, item_)
                .error_code(),
            grpc::StatusCode::UNAUTHENTICATED);

  auto first = make_authorization(*buyer_, "Escrow.Withdraw", 1, item_);
  EXPECT_TRUE(auth.authenticate(first, "Escrow.Withdraw", caller, item_).ok());
  auto second = make_authorization(*buyer_, "Escrow.Withdraw", 2, item_);
  EXPECT_TRUE(auth.authenticate(second, "Escrow.Withdraw", caller, item_).ok());

  // Nonces are per account.
  EXPECT_EQ(auth.next_nonce(vouch::testing::account_of(*seller_)), 1u);
}

TEST_F(authenticator_test, missing_signature_is_invalid) {
  auto auth = make_authenticator();
  auto request = vouch::escrow::v1::Authorization{};
  request.set_nonce(1);
  auto caller = vouch::schema::account_id_t{};
  EXPECT_EQ(auth.authenticate(request, "Escrow.Take", caller, item_)
                .error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(authenticator_test, admin_calls_need_the_configured_key) {
  auto account = vouch::testing::make_hash(0x10);
  auto amount = amount_t{500};

  auto closed = make_authenticator();
  auto request = make_authorization(*seller_, "Ledger.Deposit", 1, account,
                                    amount);
  EXPECT_EQ(closed.authenticate_admin(request, "Ledger.Deposit", account,
                                      amount)
                .error_code(),
            grpc::StatusCode::PERMISSION_DENIED);

  auto open = make_authenticator(
      vouch::schema::public_key_t{seller_->public_key});
  auto stranger = make_authorization(*buyer_, "Ledger.Deposit", 1, account,
                                     amount);
  EXPECT_EQ(open.authenticate_admin(stranger, "Ledger.Deposit", account, amount)
                .error_code(),
            grpc::StatusCode::PERMISSION_DENIED);
  EXPECT_TRUE(
      open.authenticate_admin(request, "Ledger.Deposit", account, amount).ok());
}
