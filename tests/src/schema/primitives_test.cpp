#include <gtest/gtest.h>
#include <vouch/blake3/hash.hpp>
#include <vouch/schema/encoding/scale/encoder.hpp>
#include <vouch/schema/escrow_error_code.hpp>
#include <vouch/schema/key/escrow_keys.hpp>
#include <vouch/schema/primitives.hpp>

#include <algorithm>
#include <limits>
#include <string_view>

namespace {

using encoder_t = vouch::schema::encoding::encoder<
    vouch::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = vouch::schema::bytes_t(32, 0xAB);
  auto hash = vouch::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = vouch::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  auto short_hex = vouch::schema::try_make_hash32(std::string_view{"0102"});
  EXPECT_FALSE(short_hex.has_value());

  auto bytes = vouch::schema::bytes_t(31, 0x01);
  auto short_bytes =
      vouch::schema::try_make_hash32(vouch::schema::bytes_view_t{bytes});
  EXPECT_FALSE(short_bytes.has_value());
}

TEST(primitives, hex_round_trips_and_rejects_garbage) {
  auto payload = vouch::schema::bytes_t{0x00, 0x7F, 0x80, 0xFE, 0xFF};
  auto hex = vouch::schema::to_hex(payload);
  EXPECT_EQ(hex, "007f80feff");
  EXPECT_EQ(vouch::schema::from_hex(hex), payload);
  EXPECT_EQ(vouch::schema::from_hex("0x007F80FEFF"), payload);

  EXPECT_FALSE(vouch::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(vouch::schema::try_from_hex("zz").has_value());
}

TEST(primitives, try_make_amount_parses_decimal_only) {
  auto hundred = vouch::schema::try_make_amount("100");
  ASSERT_TRUE(hundred.has_value());
  EXPECT_EQ(*hundred, vouch::schema::amount_t{100});

  EXPECT_FALSE(vouch::schema::try_make_amount("").has_value());
  EXPECT_FALSE(vouch::schema::try_make_amount("-1").has_value());
  EXPECT_FALSE(vouch::schema::try_make_amount("12a").has_value());
  EXPECT_FALSE(vouch::schema::try_make_amount(" 1").has_value());
}

TEST(primitives, try_make_amount_rejects_overflow) {
  // 2^256 - 1 fits, 2^256 does not.
  auto max = std::string_view{
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639935"};
  auto over = std::string_view{
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639936"};
  auto parsed = vouch::schema::try_make_amount(max);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, std::numeric_limits<vouch::schema::amount_t>::max());
  EXPECT_FALSE(vouch::schema::try_make_amount(over).has_value());
}

TEST(escrow_error_code, names_round_trip) {
  for (const auto& [name, code] : vouch::schema::kEscrowErrorCodeMappings) {
    EXPECT_EQ(vouch::schema::to_string(code), name);
    auto parsed = vouch::schema::try_escrow_error_code(name);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, code);
  }
  EXPECT_FALSE(vouch::schema::try_escrow_error_code("nope").has_value());
}

TEST(escrow_error_code, values_are_stable) {
  using enum vouch::schema::escrow_error_code;
  EXPECT_EQ(static_cast<uint32_t>(item_reserved), 1u);
  EXPECT_EQ(static_cast<uint32_t>(not_buyer), 2u);
  EXPECT_EQ(static_cast<uint32_t>(nothing_reserved), 3u);
  EXPECT_EQ(static_cast<uint32_t>(collaborator_failure), 17u);
}

TEST(escrow_keys, event_keys_sort_in_sequence_order) {
  auto encoder = encoder_t{};
  auto k1 = vouch::schema::key::make_event_key(encoder, 1);
  auto k255 = vouch::schema::key::make_event_key(encoder, 255);
  auto k256 = vouch::schema::key::make_event_key(encoder, 256);
  EXPECT_TRUE(std::ranges::lexicographical_compare(k1, k255));
  EXPECT_TRUE(std::ranges::lexicographical_compare(k255, k256));

  auto prefix = vouch::schema::key::make_prefix_key(
      encoder, vouch::schema::key::kEventPrefix);
  EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix),
                         std::begin(k256)));
}

TEST(escrow_keys, keyspaces_do_not_collide) {
  auto encoder = encoder_t{};
  auto id = vouch::schema::hash32_t{};
  id.fill(0x11);
  auto slot = vouch::schema::key::make_slot_key(encoder, id);
  auto listing = vouch::schema::key::make_listing_key(encoder, id);
  auto item = vouch::schema::key::make_item_key(encoder, id);
  EXPECT_NE(slot, listing);
  EXPECT_NE(listing, item);
  EXPECT_NE(slot, item);
}

TEST(blake3, hash_is_deterministic_and_part_sensitive) {
  auto a = vouch::blake3::hash(std::string_view{"vouch"});
  auto b = vouch::blake3::hash(std::string_view{"vouch"});
  EXPECT_EQ(a, b);

  auto ab = vouch::schema::make_bytes(std::string_view{"ab"});
  auto c = vouch::schema::make_bytes(std::string_view{"c"});
  auto abc = vouch::schema::make_bytes(std::string_view{"abc"});
  EXPECT_EQ(vouch::blake3::hash({vouch::schema::bytes_view_t{ab},
                                 vouch::schema::bytes_view_t{c}}),
            vouch::blake3::hash(vouch::schema::bytes_view_t{abc}));
  EXPECT_NE(vouch::blake3::hash(vouch::schema::bytes_view_t{abc}),
            vouch::blake3::hash(vouch::schema::bytes_view_t{ab}));
}
