#include <gtest/gtest.h>
#include <vouch/escrow/backend.hpp>
#include <vouch/escrow/escrow_error.hpp>
#include <vouch/ledger/store_ledger.hpp>
#include <vouch/testing/common.hpp>

#include <limits>
#include <string>

namespace {

using vouch::escrow::escrow_error;
using vouch::schema::amount_t;
using vouch::schema::escrow_error_code;

escrow_error_code code_of(auto&& action) {
  try {
    action();
  } catch (const escrow_error& error) {
    return error.code();
  }
  return escrow_error_code::collaborator_failure;
}

class store_ledger_test : public ::testing::Test {
 protected:
  store_ledger_test()
      : path_{vouch::testing::make_db_path("vouch_ledger")},
        storage_{vouch::storage::make_storage<
            vouch::storage::rocksdb_storage_tag>(path_)},
        ledger_{encoder_, storage_} {}

  ~store_ledger_test() override {
    storage_.database.reset();
    vouch::testing::remove_path(path_);
  }

  const vouch::schema::account_id_t seller_ = vouch::testing::make_hash(0x01);
  const vouch::schema::account_id_t buyer_ = vouch::testing::make_hash(0x10);
  std::string path_;
  vouch::escrow::encoder_t encoder_;
  vouch::escrow::storage_t storage_;
  vouch::ledger::store_ledger ledger_;
};

}  // namespace

TEST_F(store_ledger_test, deposit_accumulates_balance) {
  EXPECT_EQ(ledger_.balance(buyer_), amount_t{0});
  ledger_.deposit(buyer_, 60);
  ledger_.deposit(buyer_, 40);
  EXPECT_EQ(ledger_.balance(buyer_), amount_t{100});
}

TEST_F(store_ledger_test, deposit_refuses_overflow) {
  ledger_.deposit(buyer_, std::numeric_limits<amount_t>::max());
  EXPECT_EQ(code_of([&] { ledger_.deposit(buyer_, 1); }),
            escrow_error_code::collaborator_failure);
  EXPECT_EQ(ledger_.balance(buyer_), std::numeric_limits<amount_t>::max());
}

TEST_F(store_ledger_test, minted_items_have_distinct_ids) {
  auto first = ledger_.mint_item(seller_, {0x01});
  auto second = ledger_.mint_item(seller_, {0x01});
  EXPECT_NE(first, second);

  auto item = ledger_.item(first);
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->owner, seller_);
  EXPECT_EQ(item->metadata, vouch::schema::bytes_t{0x01});
  EXPECT_FALSE(ledger_.item(vouch::testing::make_hash(0x77)).has_value());
}

TEST_F(store_ledger_test, list_checks_ownership_and_duplicates) {
  auto item = ledger_.mint_item(seller_, {});
  EXPECT_EQ(code_of([&] { ledger_.list(buyer_, item, 100); }),
            escrow_error_code::not_item_owner);
  EXPECT_EQ(code_of([&] {
              ledger_.list(seller_, vouch::testing::make_hash(0x77), 100);
            }),
            escrow_error_code::item_missing);

  ledger_.list(seller_, item, 100);
  EXPECT_TRUE(ledger_.is_listed(item));
  EXPECT_EQ(code_of([&] { ledger_.list(seller_, item, 100); }),
            escrow_error_code::item_already_listed);

  auto listings = ledger_.listings();
  ASSERT_EQ(listings.size(), 1u);
  EXPECT_EQ(listings[0].seller, seller_);
  EXPECT_EQ(listings[0].price, amount_t{100});
}

TEST_F(store_ledger_test, take_returns_the_item_and_ends_listing) {
  auto item = ledger_.mint_item(seller_, {0x02});
  ledger_.list(seller_, item, 100);
  EXPECT_EQ(code_of([&] { ledger_.take(buyer_, item); }),
            escrow_error_code::not_seller);

  auto taken = ledger_.take(seller_, item);
  EXPECT_EQ(taken.item_id, item);
  EXPECT_EQ(taken.owner, seller_);
  EXPECT_FALSE(ledger_.is_listed(item));
  EXPECT_EQ(code_of([&] { ledger_.delist(seller_, item); }),
            escrow_error_code::item_not_listed);
}

TEST_F(store_ledger_test, escrow_holds_funds_until_released) {
  ledger_.deposit(buyer_, 100);
  EXPECT_EQ(code_of([&] { ledger_.escrow(buyer_, 101); }),
            escrow_error_code::insufficient_funds);

  auto held = ledger_.escrow(buyer_, 100);
  EXPECT_EQ(ledger_.balance(buyer_), amount_t{0});
  ASSERT_TRUE(ledger_.holding(held.holding_id).has_value());

  ledger_.release(held, buyer_);
  EXPECT_EQ(ledger_.balance(buyer_), amount_t{100});
  EXPECT_FALSE(ledger_.holding(held.holding_id).has_value());
  EXPECT_EQ(code_of([&] { ledger_.release(held, buyer_); }),
            escrow_error_code::holding_missing);
}

TEST_F(store_ledger_test, forward_requires_matching_holding) {
  ledger_.deposit(buyer_, 100);
  auto held = ledger_.escrow(buyer_, 100);
  auto forged = held;
  forged.amount = 1000;
  EXPECT_EQ(code_of([&] { ledger_.forward(forged); }),
            escrow_error_code::holding_missing);

  auto payment = ledger_.forward(held);
  EXPECT_EQ(payment.amount, amount_t{100});
  EXPECT_FALSE(ledger_.holding(held.holding_id).has_value());
}

TEST_F(store_ledger_test, purchase_settles_at_listed_price) {
  auto item = ledger_.mint_item(seller_, {});
  ledger_.list(seller_, item, 100);
  EXPECT_EQ(code_of([&] {
              ledger_.purchase(item, vouch::schema::payment_t{.amount = 99},
                               buyer_);
            }),
            escrow_error_code::payment_mismatch);

  auto sale =
      ledger_.purchase(item, vouch::schema::payment_t{.amount = 100}, buyer_);
  EXPECT_EQ(sale.item.owner, buyer_);
  EXPECT_EQ(sale.receipt.seller, seller_);
  EXPECT_EQ(sale.receipt.buyer, buyer_);
  EXPECT_EQ(sale.receipt.amount, amount_t{100});
  EXPECT_EQ(ledger_.balance(seller_), amount_t{100});
  EXPECT_FALSE(ledger_.is_listed(item));
  EXPECT_EQ(ledger_.item(item)->owner, buyer_);
}

TEST_F(store_ledger_test, capability_moves_through_escrow_custody) {
  auto item = ledger_.mint_item(seller_, {});
  ledger_.list(seller_, item, 100);
  EXPECT_EQ(code_of([&] { ledger_.issue_capability(buyer_, item, buyer_, 50); }),
            escrow_error_code::not_seller);
  auto capability_id = ledger_.issue_capability(seller_, item, buyer_, 50);

  EXPECT_EQ(code_of([&] {
              ledger_.deposit_capability(capability_id, seller_);
            }),
            escrow_error_code::capability_mismatch);
  EXPECT_EQ(code_of([&] {
              ledger_.deposit_capability(vouch::testing::make_hash(0x99),
                                         buyer_);
            }),
            escrow_error_code::capability_missing);

  auto deposited = ledger_.deposit_capability(capability_id, buyer_);
  EXPECT_EQ(deposited.holder, buyer_);
  EXPECT_EQ(ledger_.capability(capability_id)->holder,
            vouch::ledger::store_ledger::escrow_account());

  ledger_.return_capability(deposited, buyer_);
  EXPECT_EQ(ledger_.capability(capability_id)->holder, buyer_);
  EXPECT_EQ(code_of([&] { ledger_.return_capability(deposited, buyer_); }),
            escrow_error_code::capability_missing);
}

TEST_F(store_ledger_test, capability_purchase_consumes_capability) {
  auto item = ledger_.mint_item(seller_, {});
  ledger_.list(seller_, item, 100);
  auto capability_id = ledger_.issue_capability(seller_, item, buyer_, 50);
  auto capability = ledger_.capability(capability_id);
  ASSERT_TRUE(capability.has_value());

  // Not in custody yet.
  EXPECT_EQ(code_of([&] {
              ledger_.purchase_with_capability(
                  *capability, vouch::schema::payment_t{.amount = 50}, buyer_);
            }),
            escrow_error_code::capability_missing);

  auto deposited = ledger_.deposit_capability(capability_id, buyer_);
  EXPECT_EQ(code_of([&] {
              ledger_.purchase_with_capability(
                  deposited, vouch::schema::payment_t{.amount = 49}, buyer_);
            }),
            escrow_error_code::payment_mismatch);

  auto sale = ledger_.purchase_with_capability(
      deposited, vouch::schema::payment_t{.amount = 60}, buyer_);
  EXPECT_EQ(sale.item.owner, buyer_);
  EXPECT_EQ(sale.receipt.amount, amount_t{60});
  EXPECT_EQ(ledger_.balance(seller_), amount_t{60});
  EXPECT_FALSE(ledger_.capability(capability_id).has_value());
}
