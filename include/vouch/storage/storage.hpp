#pragma once
#include <vouch/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace vouch::storage {

using key_value_entry_t =
    std::pair<vouch::schema::bytes_t, vouch::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const vouch::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const vouch::schema::bytes_view_t& key,
           const T& value);

  /// Remove key; removing a missing key is not an error.
  void erase(const vouch::schema::bytes_view_t& key);

  bool contains(const vouch::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const vouch::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// All-or-nothing unit of work over a storage backend.
///
/// Writes made while a scope is open are buffered and only reach the backend
/// when the outermost scope commits. A scope destroyed without `commit()`
/// discards everything written since it opened. Scopes nest: an inner scope
/// that is abandoned poisons the enclosing one.
template <typename Library>
class transaction_scope;

}  // namespace vouch::storage
