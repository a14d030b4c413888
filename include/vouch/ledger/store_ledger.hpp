#pragma once

#include <vouch/escrow/backend.hpp>
#include <vouch/escrow/listing_ledger.hpp>
#include <vouch/escrow/payment_transfer.hpp>
#include <vouch/schema/exclusive_capability.hpp>
#include <vouch/schema/held_funds.hpp>
#include <vouch/schema/item.hpp>
#include <vouch/schema/listing_state.hpp>
#include <vouch/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace vouch::ledger {

/// Reference host ledger kept in the same store as the escrow slots.
///
/// Balances, items, listings, exclusive purchase capabilities and escrow
/// holdings. Funds are conserved: balances plus open holdings only grow
/// through `deposit`. The administrative methods open their own transaction
/// scope; the collaborator methods join the caller's.
class store_ledger final
    : public vouch::escrow::listing_ledger<vouch::schema::item_t>,
      public vouch::escrow::payment_transfer {
 public:
  store_ledger(vouch::escrow::encoder_t& encoder,
               vouch::escrow::storage_t& storage);

  /// Custodian of capabilities deposited into pending intents.
  static vouch::schema::account_id_t escrow_account();

  void deposit(const vouch::schema::account_id_t& account,
               const vouch::schema::amount_t& amount);
  vouch::schema::amount_t balance(
      const vouch::schema::account_id_t& account) const;

  vouch::schema::item_id_t mint_item(const vouch::schema::account_id_t& owner,
                                     const vouch::schema::bytes_t& metadata);
  std::optional<vouch::schema::item_t> item(
      const vouch::schema::item_id_t& item_id) const;

  /// Seller grants `buyer` the right to purchase its listed item at or above
  /// `minimum_price`.
  vouch::schema::capability_id_t issue_capability(
      const vouch::schema::account_id_t& seller,
      const vouch::schema::item_id_t& item_id,
      const vouch::schema::account_id_t& buyer,
      const vouch::schema::amount_t& minimum_price);
  std::optional<vouch::schema::exclusive_capability_t> capability(
      const vouch::schema::capability_id_t& capability_id) const;

  std::optional<vouch::schema::held_funds_t> holding(
      const vouch::schema::holding_id_t& holding_id) const;

  std::vector<vouch::schema::listing_state_t> listings() const;

  void list(const vouch::schema::account_id_t& seller,
            const vouch::schema::item_id_t& item_id,
            const vouch::schema::amount_t& price) override;
  void delist(const vouch::schema::account_id_t& seller,
              const vouch::schema::item_id_t& item_id) override;
  vouch::schema::item_t take(const vouch::schema::account_id_t& seller,
                             const vouch::schema::item_id_t& item_id) override;
  vouch::escrow::purchase_receipt<vouch::schema::item_t> purchase(
      const vouch::schema::item_id_t& item_id,
      const vouch::schema::payment_t& payment,
      const vouch::schema::account_id_t& recipient) override;
  vouch::escrow::purchase_receipt<vouch::schema::item_t>
  purchase_with_capability(
      const vouch::schema::exclusive_capability_t& capability,
      const vouch::schema::payment_t& payment,
      const vouch::schema::account_id_t& recipient) override;
  bool is_listed(const vouch::schema::item_id_t& item_id) const override;
  std::optional<vouch::schema::listing_state_t> listing(
      const vouch::schema::item_id_t& item_id) const override;
  vouch::schema::exclusive_capability_t deposit_capability(
      const vouch::schema::capability_id_t& capability_id,
      const vouch::schema::account_id_t& holder) override;
  void return_capability(
      const vouch::schema::exclusive_capability_t& capability,
      const vouch::schema::account_id_t& recipient) override;

  vouch::schema::held_funds_t escrow(
      const vouch::schema::account_id_t& payer,
      const vouch::schema::amount_t& amount) override;
  void release(const vouch::schema::held_funds_t& held,
               const vouch::schema::account_id_t& recipient) override;
  vouch::schema::payment_t forward(
      const vouch::schema::held_funds_t& held) override;

 private:
  uint64_t next_nonce();
  void credit(const vouch::schema::account_id_t& account,
              const vouch::schema::amount_t& amount);
  void debit(const vouch::schema::account_id_t& account,
             const vouch::schema::amount_t& amount);
  vouch::schema::item_t load_item(
      const vouch::schema::item_id_t& item_id) const;
  vouch::schema::listing_state_t load_listing(
      const vouch::schema::item_id_t& item_id) const;
  vouch::schema::held_funds_t claim_holding(
      const vouch::schema::held_funds_t& held);
  vouch::escrow::purchase_receipt<vouch::schema::item_t> settle(
      const vouch::schema::listing_state_t& sale,
      const vouch::schema::payment_t& payment,
      const vouch::schema::account_id_t& recipient);

  vouch::escrow::encoder_t& encoder_;
  vouch::escrow::storage_t& storage_;
};

}  // namespace vouch::ledger
