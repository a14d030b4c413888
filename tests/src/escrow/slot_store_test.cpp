#include <gtest/gtest.h>
#include <vouch/escrow/backend.hpp>
#include <vouch/escrow/escrow_error.hpp>
#include <vouch/escrow/slot_store.hpp>
#include <vouch/testing/common.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace {

using vouch::escrow::escrow_error;
using vouch::schema::escrow_error_code;

vouch::schema::purchase_intent_t make_intent(
    const vouch::schema::item_id_t& item_id,
    const uint8_t buyer_seed) {
  return vouch::schema::purchase_intent_t{
      .item_id = item_id,
      .challenge = vouch::testing::make_challenge("r1"),
      .buyer_public_key = vouch::schema::ed25519_public_key{},
      .escrowed_funds =
          vouch::schema::held_funds_t{
              .holding_id = vouch::testing::make_hash(0xA0),
              .depositor = vouch::testing::make_hash(buyer_seed),
              .amount = 100},
      .buyer = vouch::testing::make_hash(buyer_seed),
  };
}

escrow_error_code code_of(auto&& action) {
  try {
    action();
  } catch (const escrow_error& error) {
    return error.code();
  }
  return escrow_error_code::collaborator_failure;
}

class slot_store_test : public ::testing::Test {
 protected:
  slot_store_test()
      : path_{vouch::testing::make_db_path("vouch_slots")},
        storage_{vouch::storage::make_storage<
            vouch::storage::rocksdb_storage_tag>(path_)},
        slots_{encoder_, storage_} {}

  ~slot_store_test() override {
    storage_.database.reset();
    vouch::testing::remove_path(path_);
  }

  std::string path_;
  vouch::escrow::encoder_t encoder_;
  vouch::escrow::storage_t storage_;
  vouch::escrow::slot_store slots_;
};

}  // namespace

TEST_F(slot_store_test, new_slot_is_empty) {
  auto item = vouch::testing::make_hash(1);
  EXPECT_FALSE(slots_.contains(item));
  slots_.create_slot(item);

  EXPECT_TRUE(slots_.contains(item));
  EXPECT_FALSE(slots_.is_occupied(item));
  auto slot = slots_.find(item);
  ASSERT_TRUE(slot.has_value());
  EXPECT_EQ(slot->item_id, item);
  EXPECT_FALSE(slot->intent.has_value());
}

TEST_F(slot_store_test, create_slot_rejects_duplicates) {
  auto item = vouch::testing::make_hash(1);
  slots_.create_slot(item);
  EXPECT_EQ(code_of([&] { slots_.create_slot(item); }),
            escrow_error_code::duplicate_slot);
}

TEST_F(slot_store_test, reserve_holds_one_intent) {
  auto item = vouch::testing::make_hash(1);
  slots_.create_slot(item);
  slots_.reserve(item, make_intent(item, 0x10));
  EXPECT_TRUE(slots_.is_occupied(item));

  EXPECT_EQ(code_of([&] { slots_.reserve(item, make_intent(item, 0x20)); }),
            escrow_error_code::item_reserved);
  auto slot = slots_.find(item);
  ASSERT_TRUE(slot && slot->intent);
  EXPECT_EQ(slot->intent->buyer, vouch::testing::make_hash(0x10));
}

TEST_F(slot_store_test, reserve_requires_a_slot) {
  auto item = vouch::testing::make_hash(1);
  EXPECT_EQ(code_of([&] { slots_.reserve(item, make_intent(item, 0x10)); }),
            escrow_error_code::slot_missing);
}

TEST_F(slot_store_test, take_intent_empties_the_slot_once) {
  auto item = vouch::testing::make_hash(1);
  slots_.create_slot(item);
  slots_.reserve(item, make_intent(item, 0x10));

  auto intent = slots_.take_intent(item);
  EXPECT_EQ(intent.buyer, vouch::testing::make_hash(0x10));
  EXPECT_EQ(intent.escrowed_funds.amount, vouch::schema::amount_t{100});
  EXPECT_EQ(intent.challenge, vouch::testing::make_challenge("r1"));
  EXPECT_TRUE(slots_.contains(item));
  EXPECT_FALSE(slots_.is_occupied(item));

  EXPECT_EQ(code_of([&] { slots_.take_intent(item); }),
            escrow_error_code::nothing_reserved);
}

TEST_F(slot_store_test, remove_slot_refuses_pending_intent) {
  auto item = vouch::testing::make_hash(1);
  slots_.create_slot(item);
  slots_.reserve(item, make_intent(item, 0x10));
  EXPECT_EQ(code_of([&] { slots_.remove_slot(item); }),
            escrow_error_code::item_reserved);

  slots_.take_intent(item);
  slots_.remove_slot(item);
  EXPECT_FALSE(slots_.contains(item));
  EXPECT_EQ(code_of([&] { slots_.remove_slot(item); }),
            escrow_error_code::slot_missing);
}

TEST_F(slot_store_test, reserved_items_lists_occupied_slots_only) {
  auto first = vouch::testing::make_hash(1);
  auto second = vouch::testing::make_hash(2);
  auto third = vouch::testing::make_hash(3);
  slots_.create_slot(first);
  slots_.create_slot(second);
  slots_.create_slot(third);
  slots_.reserve(first, make_intent(first, 0x10));
  slots_.reserve(third, make_intent(third, 0x30));

  auto reserved = slots_.reserved_items();
  ASSERT_EQ(reserved.size(), 2u);
  auto buyers = std::vector<vouch::schema::account_id_t>{reserved[0].buyer,
                                                          reserved[1].buyer};
  EXPECT_NE(std::find(buyers.begin(), buyers.end(),
                      vouch::testing::make_hash(0x10)),
            buyers.end());
  EXPECT_NE(std::find(buyers.begin(), buyers.end(),
                      vouch::testing::make_hash(0x30)),
            buyers.end());
}
