#pragma once

#include <vouch/schema/held_funds.hpp>
#include <vouch/schema/payment.hpp>
#include <vouch/schema/primitives.hpp>

namespace vouch::escrow {

/// Fungible balance movement. Held funds leave the payer's control until
/// they are released back or forwarded into a purchase.
class payment_transfer {
 public:
  virtual ~payment_transfer() = default;

  virtual vouch::schema::held_funds_t escrow(
      const vouch::schema::account_id_t& payer,
      const vouch::schema::amount_t& amount) = 0;

  virtual void release(const vouch::schema::held_funds_t& held,
                       const vouch::schema::account_id_t& recipient) = 0;

  virtual vouch::schema::payment_t forward(
      const vouch::schema::held_funds_t& held) = 0;
};

}  // namespace vouch::escrow
