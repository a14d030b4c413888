#pragma once

#include <vouch/escrow/backend.hpp>
#include <vouch/schema/escrow_slot.hpp>
#include <vouch/schema/purchase_intent.hpp>
#include <optional>
#include <vector>

namespace vouch::escrow {

/// Per-item escrow slots. A slot exists while its item is listed and holds
/// at most one pending purchase intent. All mutation goes through
/// `reserve`, `take_intent` and `remove_slot`.
class slot_store final {
 public:
  slot_store(encoder_t& encoder, storage_t& storage);

  /// Throws duplicate_slot.
  void create_slot(const vouch::schema::item_id_t& item_id);

  /// Throws slot_missing or item_reserved.
  void reserve(const vouch::schema::item_id_t& item_id,
               const vouch::schema::purchase_intent_t& intent);

  /// Throws slot_missing or nothing_reserved.
  vouch::schema::purchase_intent_t take_intent(
      const vouch::schema::item_id_t& item_id);

  /// Throws slot_missing, or item_reserved while an intent is still pending.
  void remove_slot(const vouch::schema::item_id_t& item_id);

  bool contains(const vouch::schema::item_id_t& item_id) const;
  bool is_occupied(const vouch::schema::item_id_t& item_id) const;
  std::optional<vouch::schema::escrow_slot_t> find(
      const vouch::schema::item_id_t& item_id) const;
  std::vector<vouch::schema::purchase_intent_t> reserved_items() const;

 private:
  vouch::schema::escrow_slot_t load(
      const vouch::schema::item_id_t& item_id) const;

  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace vouch::escrow
