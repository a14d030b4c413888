#pragma once

#include <spdlog/spdlog.h>
#include <vouch/escrow/backend.hpp>
#include <vouch/escrow/challenge_verifier.hpp>
#include <vouch/escrow/escrow_error.hpp>
#include <vouch/escrow/event_notifier.hpp>
#include <vouch/escrow/listing_ledger.hpp>
#include <vouch/escrow/outcome.hpp>
#include <vouch/escrow/payment_transfer.hpp>
#include <vouch/escrow/slot_store.hpp>
#include <vouch/schema/escrow_error_code.hpp>
#include <vouch/schema/escrow_result.hpp>
#include <vouch/schema/item.hpp>
#include <vouch/schema/primitives.hpp>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vouch::escrow {

/// Challenge/response escrow over a host listing ledger.
///
/// Every mutating operation runs inside one storage transaction scope: it
/// either completes or leaves no trace. Failures are reported through the
/// result `code` (an `escrow_error_code`), never by throwing.
template <escrowable_item Item>
class engine final {
 public:
  engine(encoder_t& encoder,
         storage_t& storage,
         listing_ledger<Item>& ledger,
         payment_transfer& payments,
         event_notifier& notifier,
         challenge_verifier_t verifier = make_signature_verifier());

  /// List an item the seller owns and open its (empty) escrow slot.
  vouch::schema::escrow_result_t list(
      const vouch::schema::account_id_t& seller,
      const vouch::schema::item_id_t& item_id,
      const vouch::schema::amount_t& price);

  /// Reserve a listed item: escrow `payment`, store the intent and emit
  /// `challenge_issued`.
  ///
  /// Without `capability_id` the payment must equal the listed price. With
  /// it, the capability must be held by the buyer, bound to this item and
  /// issued by the current seller, and the payment must be at least its
  /// minimum price.
  vouch::schema::escrow_result_t purchase(
      const vouch::schema::account_id_t& buyer,
      const vouch::schema::item_id_t& item_id,
      const vouch::schema::bytes_t& challenge,
      const vouch::schema::public_key_t& buyer_public_key,
      const vouch::schema::amount_t& payment,
      const std::optional<vouch::schema::capability_id_t>& capability_id =
          std::nullopt);

  /// Seller's answer to a pending challenge. A verified answer settles the
  /// trade; a rejected one refunds the buyer and reopens the slot.
  response_result<Item> submit_response(
      const vouch::schema::account_id_t& seller,
      const vouch::schema::item_id_t& item_id,
      const vouch::schema::signature_t& signature);

  /// Buyer cancels its own pending intent and is refunded in full.
  vouch::schema::escrow_result_t withdraw(
      const vouch::schema::account_id_t& caller,
      const vouch::schema::item_id_t& item_id);

  /// Remove the listing; a pending intent is refunded first.
  vouch::schema::escrow_result_t delist(
      const vouch::schema::account_id_t& seller,
      const vouch::schema::item_id_t& item_id);

  /// Remove the listing and hand the item back; a pending intent is refunded
  /// first.
  take_result<Item> take(const vouch::schema::account_id_t& seller,
                         const vouch::schema::item_id_t& item_id);

  bool is_purchasable(const vouch::schema::item_id_t& item_id) const;

  std::optional<vouch::schema::purchase_intent_t> pending_intent(
      const vouch::schema::item_id_t& item_id) const;

  std::vector<vouch::schema::purchase_intent_t> reserved_items() const;

  void set_challenge_verifier(challenge_verifier_t verifier);

 private:
  template <typename Result, typename Body>
  Result execute(std::string_view codespace, Body&& body);

  vouch::schema::listing_state_t require_seller(
      const vouch::schema::account_id_t& seller,
      const vouch::schema::item_id_t& item_id) const;

  /// Release the escrowed funds and hand any capability back to the buyer.
  vouch::schema::refund_t refund(const vouch::schema::purchase_intent_t& intent);

  std::optional<vouch::schema::refund_t> refund_pending(
      const vouch::schema::item_id_t& item_id);

  void publish(const vouch::schema::escrow_event_t& event,
               std::vector<vouch::schema::escrow_event_t>& events);

  bool verify(const vouch::schema::purchase_intent_t& intent,
              const vouch::schema::signature_t& signature) const;

  storage_t& storage_;
  listing_ledger<Item>& ledger_;
  payment_transfer& payments_;
  event_notifier& notifier_;
  slot_store slots_;
  mutable std::mutex verifier_mutex_;
  challenge_verifier_t verifier_;
};

template <escrowable_item Item>
engine<Item>::engine(encoder_t& encoder,
                     storage_t& storage,
                     listing_ledger<Item>& ledger,
                     payment_transfer& payments,
                     event_notifier& notifier,
                     challenge_verifier_t verifier)
    : storage_{storage},
      ledger_{ledger},
      payments_{payments},
      notifier_{notifier},
      slots_{encoder, storage},
      verifier_{std::move(verifier)} {}

template <escrowable_item Item>
template <typename Result, typename Body>
Result engine<Item>::execute(const std::string_view codespace, Body&& body) {
  auto fail = [&](const vouch::schema::escrow_error_code code,
                  const std::string& log) {
    auto result = Result{};
    result.code = static_cast<uint32_t>(code);
    result.log = log;
    result.codespace = std::string{codespace};
    spdlog::warn("{} failed: {} ({})", codespace,
                 vouch::schema::to_string(code), log);
    return result;
  };

  try {
    auto scope = transaction_scope_t{storage_};
    auto result = Result{};
    result.codespace = std::string{codespace};
    body(result);
    if (!scope.commit()) {
      return fail(vouch::schema::escrow_error_code::collaborator_failure,
                  "transaction aborted by a nested scope");
    }
    return result;
  } catch (const escrow_error& error) {
    return fail(error.code(), error.what());
  } catch (const std::exception& error) {
    return fail(vouch::schema::escrow_error_code::collaborator_failure,
                error.what());
  }
}

template <escrowable_item Item>
vouch::schema::listing_state_t engine<Item>::require_seller(
    const vouch::schema::account_id_t& seller,
    const vouch::schema::item_id_t& item_id) const {
  auto listing = ledger_.listing(item_id);
  if (!listing) {
    throw escrow_error{vouch::schema::escrow_error_code::item_not_listed,
                       "item " + vouch::schema::to_hex(item_id) +
                           " is not listed"};
  }
  if (listing->seller != seller) {
    throw escrow_error{vouch::schema::escrow_error_code::not_seller,
                       "caller is not the seller of item " +
                           vouch::schema::to_hex(item_id)};
  }
  return *listing;
}

template <escrowable_item Item>
vouch::schema::refund_t engine<Item>::refund(
    const vouch::schema::purchase_intent_t& intent) {
  payments_.release(intent.escrowed_funds, intent.buyer);
  auto record = vouch::schema::refund_t{
      .item_id = intent.item_id,
      .buyer = intent.buyer,
      .amount = intent.escrowed_funds.amount,
  };
  if (intent.exclusive_capability) {
    const auto& capability = *intent.exclusive_capability;
    ledger_.return_capability(capability, intent.buyer);
    record.capability = vouch::schema::returned_to_buyer{
        .capability_id = capability.capability_id, .buyer = intent.buyer};
  }
  spdlog::info("Refunded {} to {} for item {}", record.amount.str(),
               vouch::schema::to_hex(record.buyer),
               vouch::schema::to_hex(record.item_id));
  return record;
}

template <escrowable_item Item>
std::optional<vouch::schema::refund_t> engine<Item>::refund_pending(
    const vouch::schema::item_id_t& item_id) {
  if (!slots_.is_occupied(item_id)) {
    return std::nullopt;
  }
  return refund(slots_.take_intent(item_id));
}

template <escrowable_item Item>
void engine<Item>::publish(
    const vouch::schema::escrow_event_t& event,
    std::vector<vouch::schema::escrow_event_t>& events) {
  notifier_.publish(event);
  events.push_back(event);
}

template <escrowable_item Item>
bool engine<Item>::verify(const vouch::schema::purchase_intent_t& intent,
                          const vouch::schema::signature_t& signature) const {
  auto verifier = challenge_verifier_t{};
  {
    auto lock = std::scoped_lock{verifier_mutex_};
    verifier = verifier_;
  }
  if (!verifier) {
    spdlog::error("No challenge verifier installed");
    return false;
  }
  return verifier(intent.buyer_public_key, signature,
                  vouch::schema::bytes_view_t{intent.challenge});
}

template <escrowable_item Item>
vouch::schema::escrow_result_t engine<Item>::list(
    const vouch::schema::account_id_t& seller,
    const vouch::schema::item_id_t& item_id,
    const vouch::schema::amount_t& price) {
  return execute<vouch::schema::escrow_result_t>(
      "vouch.list", [&](vouch::schema::escrow_result_t&) {
        ledger_.list(seller, item_id, price);
        slots_.create_slot(item_id);
        spdlog::info("Listed item {} at {}", vouch::schema::to_hex(item_id),
                     price.str());
      });
}

template <escrowable_item Item>
vouch::schema::escrow_result_t engine<Item>::purchase(
    const vouch::schema::account_id_t& buyer,
    const vouch::schema::item_id_t& item_id,
    const vouch::schema::bytes_t& challenge,
    const vouch::schema::public_key_t& buyer_public_key,
    const vouch::schema::amount_t& payment,
    const std::optional<vouch::schema::capability_id_t>& capability_id) {
  using enum vouch::schema::escrow_error_code;
  return execute<vouch::schema::escrow_result_t>(
      "vouch.purchase", [&](vouch::schema::escrow_result_t& result) {
        if (challenge.empty()) {
          throw escrow_error{invalid_challenge, "challenge must not be empty"};
        }
        auto listing = ledger_.listing(item_id);
        if (!listing) {
          throw escrow_error{item_not_listed, "item " +
                                                  vouch::schema::to_hex(item_id) +
                                                  " is not listed"};
        }
        if (slots_.is_occupied(item_id)) {
          throw escrow_error{item_reserved, "item " +
                                                vouch::schema::to_hex(item_id) +
                                                " is already reserved"};
        }

        auto capability =
            std::optional<vouch::schema::exclusive_capability_t>{};
        if (capability_id) {
          capability = ledger_.deposit_capability(*capability_id, buyer);
          if (capability->item_id != item_id ||
              capability->issuer != listing->seller) {
            throw escrow_error{capability_mismatch,
                               "capability is not valid for this listing"};
          }
          if (payment < capability->minimum_price) {
            throw escrow_error{payment_mismatch,
                               "payment is below the capability minimum"};
          }
        } else if (payment != listing->price) {
          throw escrow_error{payment_mismatch,
                             "payment must equal the listed price " +
                                 listing->price.str()};
        }

        auto intent = vouch::schema::purchase_intent_t{
            .item_id = item_id,
            .challenge = challenge,
            .buyer_public_key = buyer_public_key,
            .escrowed_funds = payments_.escrow(buyer, payment),
            .buyer = buyer,
            .exclusive_capability = std::move(capability),
        };
        slots_.reserve(item_id, intent);
        publish(vouch::schema::challenge_issued_t{.item_id = item_id,
                                                  .challenge = challenge,
                                                  .buyer = buyer},
                result.events);
      });
}

template <escrowable_item Item>
response_result<Item> engine<Item>::submit_response(
    const vouch::schema::account_id_t& seller,
    const vouch::schema::item_id_t& item_id,
    const vouch::schema::signature_t& signature) {
  return execute<response_result<Item>>(
      "vouch.respond", [&](response_result<Item>& result) {
        // Settlement drops the listing too; a replay is still
        // `nothing_reserved`.
        if (!slots_.is_occupied(item_id)) {
          throw escrow_error{vouch::schema::escrow_error_code::nothing_reserved,
                             "no pending intent for item " +
                                 vouch::schema::to_hex(item_id)};
        }
        require_seller(seller, item_id);
        auto intent = slots_.take_intent(item_id);

        if (!verify(intent, signature)) {
          spdlog::info("Response for item {} rejected",
                       vouch::schema::to_hex(item_id));
          result.outcome = refund(intent);
          return;
        }

        auto payment = payments_.forward(intent.escrowed_funds);
        const auto& capability = intent.exclusive_capability;
        auto receipt = capability ? ledger_.purchase_with_capability(
                                        *capability, payment, intent.buyer)
                                  : ledger_.purchase(item_id, payment,
                                                     intent.buyer);
        auto outcome = settled<Item>{.item = std::move(receipt.item),
                                     .receipt = receipt.receipt};
        if (capability) {
          outcome.capability = vouch::schema::consumed_by_settlement{
              .capability_id = capability->capability_id};
        }
        slots_.remove_slot(item_id);
        spdlog::info("Settled item {} for {}", vouch::schema::to_hex(item_id),
                     payment.amount.str());
        result.outcome = std::move(outcome);
      });
}

template <escrowable_item Item>
vouch::schema::escrow_result_t engine<Item>::withdraw(
    const vouch::schema::account_id_t& caller,
    const vouch::schema::item_id_t& item_id) {
  using enum vouch::schema::escrow_error_code;
  return execute<vouch::schema::escrow_result_t>(
      "vouch.withdraw", [&](vouch::schema::escrow_result_t& result) {
        auto slot = slots_.find(item_id);
        if (!slot || !slot->intent) {
          throw escrow_error{nothing_reserved,
                             "no pending intent for item " +
                                 vouch::schema::to_hex(item_id)};
        }
        if (slot->intent->buyer != caller) {
          throw escrow_error{not_buyer,
                             "only the reserving buyer may withdraw"};
        }
        auto intent = slots_.take_intent(item_id);
        result.refund = refund(intent);
        publish(vouch::schema::challenge_withdrawn_t{.item_id = item_id,
                                                     .buyer = intent.buyer},
                result.events);
      });
}

template <escrowable_item Item>
vouch::schema::escrow_result_t engine<Item>::delist(
    const vouch::schema::account_id_t& seller,
    const vouch::schema::item_id_t& item_id) {
  return execute<vouch::schema::escrow_result_t>(
      "vouch.delist", [&](vouch::schema::escrow_result_t& result) {
        require_seller(seller, item_id);
        result.refund = refund_pending(item_id);
        ledger_.delist(seller, item_id);
        slots_.remove_slot(item_id);
        spdlog::info("Delisted item {}", vouch::schema::to_hex(item_id));
      });
}

template <escrowable_item Item>
take_result<Item> engine<Item>::take(const vouch::schema::account_id_t& seller,
                                     const vouch::schema::item_id_t& item_id) {
  return execute<take_result<Item>>(
      "vouch.take", [&](take_result<Item>& result) {
        require_seller(seller, item_id);
        result.refund = refund_pending(item_id);
        result.item = ledger_.take(seller, item_id);
        slots_.remove_slot(item_id);
        spdlog::info("Took item {} off the market",
                     vouch::schema::to_hex(item_id));
      });
}

template <escrowable_item Item>
bool engine<Item>::is_purchasable(
    const vouch::schema::item_id_t& item_id) const {
  auto scope = transaction_scope_t{storage_};
  auto slot = slots_.find(item_id);
  auto purchasable = slot && !slot->intent && ledger_.is_listed(item_id);
  return scope.commit() && purchasable;
}

template <escrowable_item Item>
std::optional<vouch::schema::purchase_intent_t> engine<Item>::pending_intent(
    const vouch::schema::item_id_t& item_id) const {
  auto slot = slots_.find(item_id);
  if (!slot) {
    return std::nullopt;
  }
  return slot->intent;
}

template <escrowable_item Item>
std::vector<vouch::schema::purchase_intent_t> engine<Item>::reserved_items()
    const {
  return slots_.reserved_items();
}

template <escrowable_item Item>
void engine<Item>::set_challenge_verifier(challenge_verifier_t verifier) {
  auto lock = std::scoped_lock{verifier_mutex_};
  verifier_ = std::move(verifier);
}

extern template class engine<vouch::schema::item_t>;

}  // namespace vouch::escrow
