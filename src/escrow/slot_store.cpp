#include <spdlog/spdlog.h>
#include <vouch/escrow/escrow_error.hpp>
#include <vouch/escrow/slot_store.hpp>
#include <vouch/schema/key/escrow_keys.hpp>

using namespace vouch::schema;

namespace vouch::escrow {

slot_store::slot_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void slot_store::create_slot(const item_id_t& item_id) {
  auto key = key::make_slot_key(encoder_, item_id);
  if (storage_.contains(key)) {
    throw escrow_error{escrow_error_code::duplicate_slot,
                       "slot already exists for item " + to_hex(item_id)};
  }
  storage_.put(encoder_, key, escrow_slot_t{.item_id = item_id});
}

void slot_store::reserve(const item_id_t& item_id,
                         const purchase_intent_t& intent) {
  auto slot = load(item_id);
  if (slot.intent) {
    throw escrow_error{escrow_error_code::item_reserved,
                       "item " + to_hex(item_id) + " is already reserved"};
  }
  slot.intent = intent;
  storage_.put(encoder_, key::make_slot_key(encoder_, item_id), slot);
}

purchase_intent_t slot_store::take_intent(const item_id_t& item_id) {
  auto slot = load(item_id);
  if (!slot.intent) {
    throw escrow_error{escrow_error_code::nothing_reserved,
                       "no pending intent for item " + to_hex(item_id)};
  }
  auto intent = std::move(*slot.intent);
  slot.intent.reset();
  storage_.put(encoder_, key::make_slot_key(encoder_, item_id), slot);
  return intent;
}

void slot_store::remove_slot(const item_id_t& item_id) {
  auto slot = load(item_id);
  if (slot.intent) {
    throw escrow_error{escrow_error_code::item_reserved,
                       "refusing to drop pending intent for item " +
                           to_hex(item_id)};
  }
  storage_.erase(key::make_slot_key(encoder_, item_id));
}

bool slot_store::contains(const item_id_t& item_id) const {
  return storage_.contains(key::make_slot_key(encoder_, item_id));
}

bool slot_store::is_occupied(const item_id_t& item_id) const {
  auto slot = find(item_id);
  return slot && slot->intent.has_value();
}

std::optional<escrow_slot_t> slot_store::find(const item_id_t& item_id) const {
  return storage_.get<escrow_slot_t>(encoder_,
                                     key::make_slot_key(encoder_, item_id));
}

std::vector<purchase_intent_t> slot_store::reserved_items() const {
  auto intents = std::vector<purchase_intent_t>{};
  auto prefix = key::make_prefix_key(encoder_, key::kSlotKeyPrefix);
  for (const auto& [_, value] : storage_.list_by_prefix(prefix)) {
    auto slot = encoder_.decode<escrow_slot_t>(value);
    if (slot.intent) {
      intents.push_back(std::move(*slot.intent));
    }
  }
  return intents;
}

escrow_slot_t slot_store::load(const item_id_t& item_id) const {
  auto slot = find(item_id);
  if (!slot) {
    throw escrow_error{escrow_error_code::slot_missing,
                       "no slot for item " + to_hex(item_id)};
  }
  return *slot;
}

}  // namespace vouch::escrow
