#pragma once

#include <vouch/escrow/escrowable_item.hpp>
#include <vouch/schema/exclusive_capability.hpp>
#include <vouch/schema/listing_state.hpp>
#include <vouch/schema/payment.hpp>
#include <vouch/schema/primitives.hpp>
#include <vouch/schema/transfer_receipt.hpp>
#include <optional>

namespace vouch::escrow {

template <escrowable_item Item>
struct purchase_receipt final {
  Item item;
  vouch::schema::transfer_receipt_t receipt;
};

/// Host marketplace the escrow sits on. Failures are reported by throwing
/// `escrow_error`.
template <escrowable_item Item>
class listing_ledger {
 public:
  virtual ~listing_ledger() = default;

  /// Fails with item_missing, not_item_owner or item_already_listed.
  virtual void list(const vouch::schema::account_id_t& seller,
                    const vouch::schema::item_id_t& item_id,
                    const vouch::schema::amount_t& price) = 0;

  virtual void delist(const vouch::schema::account_id_t& seller,
                      const vouch::schema::item_id_t& item_id) = 0;

  virtual Item take(const vouch::schema::account_id_t& seller,
                    const vouch::schema::item_id_t& item_id) = 0;

  /// Listed-price purchase. Moves ownership to `recipient`, credits the
  /// seller and removes the listing.
  virtual purchase_receipt<Item> purchase(
      const vouch::schema::item_id_t& item_id,
      const vouch::schema::payment_t& payment,
      const vouch::schema::account_id_t& recipient) = 0;

  /// Capability purchase; consumes the capability held in escrow custody.
  virtual purchase_receipt<Item> purchase_with_capability(
      const vouch::schema::exclusive_capability_t& capability,
      const vouch::schema::payment_t& payment,
      const vouch::schema::account_id_t& recipient) = 0;

  virtual bool is_listed(const vouch::schema::item_id_t& item_id) const = 0;

  virtual std::optional<vouch::schema::listing_state_t> listing(
      const vouch::schema::item_id_t& item_id) const = 0;

  /// Move a capability from `holder` into escrow custody.
  virtual vouch::schema::exclusive_capability_t deposit_capability(
      const vouch::schema::capability_id_t& capability_id,
      const vouch::schema::account_id_t& holder) = 0;

  /// Hand a capability in escrow custody back to `recipient`.
  virtual void return_capability(
      const vouch::schema::exclusive_capability_t& capability,
      const vouch::schema::account_id_t& recipient) = 0;
};

}  // namespace vouch::escrow
