#pragma once

#include <vouch/schema/escrow_error_code.hpp>
#include <stdexcept>
#include <string>

namespace vouch::escrow {

/// Raised by the slot store and the ledger collaborators; the engine turns it
/// into a result code once the transaction scope has rolled back.
class escrow_error final : public std::runtime_error {
 public:
  escrow_error(const vouch::schema::escrow_error_code code,
               const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  explicit escrow_error(const vouch::schema::escrow_error_code code)
      : std::runtime_error{std::string{vouch::schema::to_string(code)}},
        code_{code} {}

  vouch::schema::escrow_error_code code() const { return code_; }

 private:
  vouch::schema::escrow_error_code code_;
};

}  // namespace vouch::escrow
