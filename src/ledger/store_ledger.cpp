#include <spdlog/spdlog.h>
#include <vouch/blake3/hash.hpp>
#include <vouch/escrow/escrow_error.hpp>
#include <vouch/ledger/store_ledger.hpp>
#include <vouch/schema/key/escrow_keys.hpp>
#include <limits>
#include <utility>

using namespace vouch::schema;
using vouch::escrow::escrow_error;

namespace vouch::ledger {

namespace {

inline constexpr auto kEscrowAccountTag = std::string_view{"vouch.escrow"};
inline constexpr auto kItemTag = std::string_view{"vouch.item"};
inline constexpr auto kHoldingTag = std::string_view{"vouch.holding"};
inline constexpr auto kCapabilityTag = std::string_view{"vouch.capability"};
inline constexpr auto kReceiptTag = std::string_view{"vouch.receipt"};

void commit(vouch::escrow::transaction_scope_t& scope) {
  if (!scope.commit()) {
    throw escrow_error{escrow_error_code::collaborator_failure,
                       "ledger transaction aborted"};
  }
}

}  // namespace

store_ledger::store_ledger(vouch::escrow::encoder_t& encoder,
                           vouch::escrow::storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

account_id_t store_ledger::escrow_account() {
  static const auto account = vouch::blake3::hash(kEscrowAccountTag);
  return account;
}

void store_ledger::deposit(const account_id_t& account,
                           const amount_t& amount) {
  auto scope = vouch::escrow::transaction_scope_t{storage_};
  credit(account, amount);
  commit(scope);
  spdlog::info("Deposited {} to {}", amount.str(), to_hex(account));
}

amount_t store_ledger::balance(const account_id_t& account) const {
  return storage_
      .get<amount_t>(encoder_, key::make_balance_key(encoder_, account))
      .value_or(amount_t{0});
}

item_id_t store_ledger::mint_item(const account_id_t& owner,
                                  const bytes_t& metadata) {
  auto scope = vouch::escrow::transaction_scope_t{storage_};
  auto nonce = encoder_.encode(next_nonce());
  auto minted = item_t{
      .item_id = vouch::blake3::hash({make_bytes_view(kItemTag), owner, nonce}),
      .owner = owner,
      .metadata = metadata,
  };
  storage_.put(encoder_, key::make_item_key(encoder_, minted.item_id), minted);
  commit(scope);
  spdlog::info("Minted item {} for {}", to_hex(minted.item_id), to_hex(owner));
  return minted.item_id;
}

std::optional<item_t> store_ledger::item(const item_id_t& item_id) const {
  return storage_.get<item_t>(encoder_, key::make_item_key(encoder_, item_id));
}

capability_id_t store_ledger::issue_capability(const account_id_t& seller,
                                               const item_id_t& item_id,
                                               const account_id_t& buyer,
                                               const amount_t& minimum_price) {
  auto scope = vouch::escrow::transaction_scope_t{storage_};
  auto current = load_listing(item_id);
  if (current.seller != seller) {
    throw escrow_error{escrow_error_code::not_seller,
                       "only the seller may issue capabilities for item " +
                           to_hex(item_id)};
  }
  auto nonce = encoder_.encode(next_nonce());
  auto issued = exclusive_capability_t{
      .capability_id = vouch::blake3::hash(
          {make_bytes_view(kCapabilityTag), item_id, seller, buyer, nonce}),
      .item_id = item_id,
      .issuer = seller,
      .holder = buyer,
      .minimum_price = minimum_price,
  };
  storage_.put(encoder_,
               key::make_capability_key(encoder_, issued.capability_id),
               issued);
  commit(scope);
  spdlog::info("Issued capability {} on item {} to {}",
               to_hex(issued.capability_id), to_hex(item_id), to_hex(buyer));
  return issued.capability_id;
}

std::optional<exclusive_capability_t> store_ledger::capability(
    const capability_id_t& capability_id) const {
  return storage_.get<exclusive_capability_t>(
      encoder_, key::make_capability_key(encoder_, capability_id));
}

std::optional<held_funds_t> store_ledger::holding(
    const holding_id_t& holding_id) const {
  return storage_.get<held_funds_t>(
      encoder_, key::make_holding_key(encoder_, holding_id));
}

std::vector<listing_state_t> store_ledger::listings() const {
  auto out = std::vector<listing_state_t>{};
  auto prefix = key::make_prefix_key(encoder_, key::kListingKeyPrefix);
  for (const auto& [_, value] : storage_.list_by_prefix(prefix)) {
    out.push_back(encoder_.decode<listing_state_t>(value));
  }
  return out;
}

void store_ledger::list(const account_id_t& seller,
                        const item_id_t& item_id,
                        const amount_t& price) {
  auto listed = load_item(item_id);
  if (listed.owner != seller) {
    throw escrow_error{escrow_error_code::not_item_owner,
                       "caller does not own item " + to_hex(item_id)};
  }
  if (is_listed(item_id)) {
    throw escrow_error{escrow_error_code::item_already_listed,
                       "item " + to_hex(item_id) + " is already listed"};
  }
  storage_.put(
      encoder_, key::make_listing_key(encoder_, item_id),
      listing_state_t{.item_id = item_id, .seller = seller, .price = price});
}

void store_ledger::delist(const account_id_t& seller,
                          const item_id_t& item_id) {
  auto current = load_listing(item_id);
  if (current.seller != seller) {
    throw escrow_error{escrow_error_code::not_seller,
                       "caller is not the seller of item " + to_hex(item_id)};
  }
  storage_.erase(key::make_listing_key(encoder_, item_id));
}

item_t store_ledger::take(const account_id_t& seller,
                          const item_id_t& item_id) {
  delist(seller, item_id);
  return load_item(item_id);
}

vouch::escrow::purchase_receipt<item_t> store_ledger::purchase(
    const item_id_t& item_id,
    const payment_t& payment,
    const account_id_t& recipient) {
  auto current = load_listing(item_id);
  if (payment.amount != current.price) {
    throw escrow_error{escrow_error_code::payment_mismatch,
                       "payment must equal the listed price " +
                           current.price.str()};
  }
  return settle(current, payment, recipient);
}

vouch::escrow::purchase_receipt<item_t> store_ledger::purchase_with_capability(
    const exclusive_capability_t& capability,
    const payment_t& payment,
    const account_id_t& recipient) {
  auto key = key::make_capability_key(encoder_, capability.capability_id);
  auto held = storage_.get<exclusive_capability_t>(encoder_, key);
  if (!held || held->holder != escrow_account()) {
    throw escrow_error{escrow_error_code::capability_missing,
                       "capability " + to_hex(capability.capability_id) +
                           " is not in escrow custody"};
  }
  auto current = load_listing(held->item_id);
  if (held->issuer != current.seller) {
    throw escrow_error{escrow_error_code::capability_mismatch,
                       "capability issuer no longer sells the item"};
  }
  if (payment.amount < held->minimum_price) {
    throw escrow_error{escrow_error_code::payment_mismatch,
                       "payment is below the capability minimum " +
                           held->minimum_price.str()};
  }
  storage_.erase(key);
  return settle(current, payment, recipient);
}

bool store_ledger::is_listed(const item_id_t& item_id) const {
  return storage_.contains(key::make_listing_key(encoder_, item_id));
}

std::optional<listing_state_t> store_ledger::listing(
    const item_id_t& item_id) const {
  return storage_.get<listing_state_t>(
      encoder_, key::make_listing_key(encoder_, item_id));
}

exclusive_capability_t store_ledger::deposit_capability(
    const capability_id_t& capability_id,
    const account_id_t& holder) {
  auto key = key::make_capability_key(encoder_, capability_id);
  auto held = storage_.get<exclusive_capability_t>(encoder_, key);
  if (!held) {
    throw escrow_error{escrow_error_code::capability_missing,
                       "no capability " + to_hex(capability_id)};
  }
  if (held->holder != holder) {
    throw escrow_error{escrow_error_code::capability_mismatch,
                       "capability " + to_hex(capability_id) +
                           " is not held by the caller"};
  }
  auto custody = *held;
  custody.holder = escrow_account();
  storage_.put(encoder_, key, custody);
  return *held;
}

void store_ledger::return_capability(const exclusive_capability_t& capability,
                                     const account_id_t& recipient) {
  auto key = key::make_capability_key(encoder_, capability.capability_id);
  auto held = storage_.get<exclusive_capability_t>(encoder_, key);
  if (!held || held->holder != escrow_account()) {
    throw escrow_error{escrow_error_code::capability_missing,
                       "capability " + to_hex(capability.capability_id) +
                           " is not in escrow custody"};
  }
  held->holder = recipient;
  storage_.put(encoder_, key, *held);
}

held_funds_t store_ledger::escrow(const account_id_t& payer,
                                  const amount_t& amount) {
  debit(payer, amount);
  auto nonce = encoder_.encode(next_nonce());
  auto held = held_funds_t{
      .holding_id =
          vouch::blake3::hash({make_bytes_view(kHoldingTag), payer, nonce}),
      .depositor = payer,
      .amount = amount,
  };
  storage_.put(encoder_, key::make_holding_key(encoder_, held.holding_id),
               held);
  return held;
}

void store_ledger::release(const held_funds_t& held,
                           const account_id_t& recipient) {
  auto claimed = claim_holding(held);
  credit(recipient, claimed.amount);
}

payment_t store_ledger::forward(const held_funds_t& held) {
  auto claimed = claim_holding(held);
  return payment_t{.amount = claimed.amount};
}

uint64_t store_ledger::next_nonce() {
  auto key = key::make_prefix_key(encoder_, key::kNonceKey);
  auto nonce = storage_.get<uint64_t>(encoder_, key).value_or(0) + 1;
  storage_.put(encoder_, key, nonce);
  return nonce;
}

void store_ledger::credit(const account_id_t& account, const amount_t& amount) {
  auto key = key::make_balance_key(encoder_, account);
  auto current = storage_.get<amount_t>(encoder_, key).value_or(amount_t{0});
  if (amount > std::numeric_limits<amount_t>::max() - current) {
    throw escrow_error{escrow_error_code::collaborator_failure,
                       "balance of " + to_hex(account) + " would overflow"};
  }
  storage_.put(encoder_, key, amount_t{current + amount});
}

void store_ledger::debit(const account_id_t& account, const amount_t& amount) {
  auto key = key::make_balance_key(encoder_, account);
  auto current = storage_.get<amount_t>(encoder_, key).value_or(amount_t{0});
  if (current < amount) {
    throw escrow_error{escrow_error_code::insufficient_funds,
                       "balance " + current.str() + " cannot cover " +
                           amount.str()};
  }
  storage_.put(encoder_, key, amount_t{current - amount});
}

item_t store_ledger::load_item(const item_id_t& item_id) const {
  auto found = item(item_id);
  if (!found) {
    throw escrow_error{escrow_error_code::item_missing,
                       "no item " + to_hex(item_id)};
  }
  return *found;
}

listing_state_t store_ledger::load_listing(const item_id_t& item_id) const {
  auto found = listing(item_id);
  if (!found) {
    throw escrow_error{escrow_error_code::item_not_listed,
                       "item " + to_hex(item_id) + " is not listed"};
  }
  return *found;
}

held_funds_t store_ledger::claim_holding(const held_funds_t& held) {
  auto key = key::make_holding_key(encoder_, held.holding_id);
  auto stored = storage_.get<held_funds_t>(encoder_, key);
  if (!stored || stored->amount != held.amount ||
      stored->depositor != held.depositor) {
    throw escrow_error{escrow_error_code::holding_missing,
                       "no matching holding " + to_hex(held.holding_id)};
  }
  storage_.erase(key);
  return *stored;
}

vouch::escrow::purchase_receipt<item_t> store_ledger::settle(
    const listing_state_t& sale,
    const payment_t& payment,
    const account_id_t& recipient) {
  auto sold = load_item(sale.item_id);
  sold.owner = recipient;
  storage_.put(encoder_, key::make_item_key(encoder_, sold.item_id), sold);
  storage_.erase(key::make_listing_key(encoder_, sale.item_id));
  credit(sale.seller, payment.amount);

  auto nonce = encoder_.encode(next_nonce());
  auto receipt = transfer_receipt_t{
      .receipt_id = vouch::blake3::hash({make_bytes_view(kReceiptTag),
                                         sale.item_id, sale.seller,
                                         recipient, nonce}),
      .item_id = sale.item_id,
      .seller = sale.seller,
      .buyer = recipient,
      .amount = payment.amount,
  };
  spdlog::info("Transferred item {} from {} to {} for {}",
               to_hex(sale.item_id), to_hex(sale.seller),
               to_hex(recipient), payment.amount.str());
  return {.item = std::move(sold), .receipt = receipt};
}

}  // namespace vouch::ledger
