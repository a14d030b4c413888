#pragma once

#include <boost/endian/conversion.hpp>
#include <vouch/schema/primitives.hpp>
#include <cstdint>
#include <iterator>
#include <string_view>

// Key layout for everything the escrow and the reference ledger persist.
namespace vouch::schema::key {

inline constexpr std::string_view kSlotKeyPrefix{"SYS|STATE|SLOT|"};
inline constexpr std::string_view kListingKeyPrefix{"SYS|STATE|LISTING|"};
inline constexpr std::string_view kItemKeyPrefix{"SYS|STATE|ITEM|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kHoldingKeyPrefix{"SYS|STATE|HOLD|"};
inline constexpr std::string_view kCapabilityKeyPrefix{"SYS|STATE|CAP|"};
inline constexpr std::string_view kNonceKey{"SYS|STATE|NONCE"};
inline constexpr std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ"};
inline constexpr std::string_view kAuthNonceKeyPrefix{"SYS|STATE|AUTH_NONCE|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder>
vouch::schema::bytes_t make_prefix_key(Encoder& encoder,
                                       std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder, typename T>
vouch::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                         std::string_view prefix,
                                         const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
vouch::schema::bytes_t make_slot_key(Encoder& encoder,
                                     const vouch::schema::item_id_t& item_id) {
  return make_prefixed_key(encoder, kSlotKeyPrefix, item_id);
}

template <typename Encoder>
vouch::schema::bytes_t make_listing_key(
    Encoder& encoder,
    const vouch::schema::item_id_t& item_id) {
  return make_prefixed_key(encoder, kListingKeyPrefix, item_id);
}

template <typename Encoder>
vouch::schema::bytes_t make_item_key(Encoder& encoder,
                                     const vouch::schema::item_id_t& item_id) {
  return make_prefixed_key(encoder, kItemKeyPrefix, item_id);
}

template <typename Encoder>
vouch::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const vouch::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix, account);
}

template <typename Encoder>
vouch::schema::bytes_t make_holding_key(
    Encoder& encoder,
    const vouch::schema::holding_id_t& holding_id) {
  return make_prefixed_key(encoder, kHoldingKeyPrefix, holding_id);
}

template <typename Encoder>
vouch::schema::bytes_t make_capability_key(
    Encoder& encoder,
    const vouch::schema::capability_id_t& capability_id) {
  return make_prefixed_key(encoder, kCapabilityKeyPrefix, capability_id);
}

template <typename Encoder>
vouch::schema::bytes_t make_auth_nonce_key(
    Encoder& encoder,
    const vouch::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kAuthNonceKeyPrefix, account);
}

/// Event keys carry the sequence big-endian so RocksDB iteration order is
/// sequence order.
template <typename Encoder>
vouch::schema::bytes_t make_event_key(Encoder& encoder, uint64_t sequence) {
  auto key = make_prefix_key(encoder, kEventPrefix);
  auto be = boost::endian::native_to_big(sequence);
  auto raw = reinterpret_cast<const uint8_t*>(&be);
  key.insert(std::end(key), raw, raw + sizeof(be));
  return key;
}

}  // namespace vouch::schema::key
