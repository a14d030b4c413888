#include <gtest/gtest.h>
#include <vouch/escrow/backend.hpp>
#include <vouch/escrow/event_notifier.hpp>
#include <vouch/testing/common.hpp>

#include <string>
#include <variant>

namespace {

class journal_notifier_test : public ::testing::Test {
 protected:
  journal_notifier_test()
      : path_{vouch::testing::make_db_path("vouch_journal")},
        storage_{vouch::storage::make_storage<
            vouch::storage::rocksdb_storage_tag>(path_)},
        journal_{encoder_, storage_} {}

  ~journal_notifier_test() override {
    storage_.database.reset();
    vouch::testing::remove_path(path_);
  }

  vouch::schema::escrow_event_t issued(const uint8_t seed) {
    return vouch::schema::challenge_issued_t{
        .item_id = vouch::testing::make_hash(seed),
        .challenge = vouch::testing::make_challenge("r1"),
        .buyer = vouch::testing::make_hash(0x10)};
  }

  std::string path_;
  vouch::escrow::encoder_t encoder_;
  vouch::escrow::storage_t storage_;
  vouch::escrow::journal_notifier journal_;
};

}  // namespace

TEST_F(journal_notifier_test, starts_empty) {
  EXPECT_EQ(journal_.last_sequence(), 0u);
  EXPECT_TRUE(journal_.events(0, 100).empty());
}

TEST_F(journal_notifier_test, sequences_are_contiguous_from_one) {
  journal_.publish(issued(1));
  journal_.publish(vouch::schema::challenge_withdrawn_t{
      .item_id = vouch::testing::make_hash(1),
      .buyer = vouch::testing::make_hash(0x10)});
  journal_.publish(issued(2));

  EXPECT_EQ(journal_.last_sequence(), 3u);
  auto records = journal_.events(1, 3);
  ASSERT_EQ(records.size(), 3u);
  for (auto i = std::size_t{0}; i < records.size(); ++i) {
    EXPECT_EQ(records[i].sequence, i + 1);
  }
  ASSERT_TRUE(std::holds_alternative<vouch::schema::challenge_withdrawn_t>(
      records[1].event));
  const auto& issued_event =
      std::get<vouch::schema::challenge_issued_t>(records[2].event);
  EXPECT_EQ(issued_event.item_id, vouch::testing::make_hash(2));
  EXPECT_EQ(issued_event.challenge, vouch::testing::make_challenge("r1"));
}

TEST_F(journal_notifier_test, range_is_inclusive_and_clamped) {
  for (uint8_t seed = 1; seed <= 5; ++seed) {
    journal_.publish(issued(seed));
  }
  auto middle = journal_.events(2, 4);
  ASSERT_EQ(middle.size(), 3u);
  EXPECT_EQ(middle.front().sequence, 2u);
  EXPECT_EQ(middle.back().sequence, 4u);

  EXPECT_EQ(journal_.events(0, 1000).size(), 5u);
  EXPECT_TRUE(journal_.events(4, 2).empty());
  EXPECT_TRUE(journal_.events(6, 10).empty());
}

TEST_F(journal_notifier_test, rolled_back_publish_leaves_no_entry) {
  journal_.publish(issued(1));
  {
    auto scope = vouch::escrow::transaction_scope_t{storage_};
    journal_.publish(issued(2));
    EXPECT_EQ(journal_.last_sequence(), 2u);
  }
  EXPECT_EQ(journal_.last_sequence(), 1u);
  journal_.publish(issued(3));
  auto records = journal_.events(1, 2);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(std::get<vouch::schema::challenge_issued_t>(records[1].event)
                .item_id,
            vouch::testing::make_hash(3));
}
