#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <vouch/common/critical.hpp>
#include <vouch/storage/storage.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace vouch::storage {

namespace detail {

/// Pending writes of the open transaction scope. `std::nullopt` marks an
/// erase.
struct write_overlay final {
  std::recursive_mutex mutex;
  uint32_t depth{};
  bool aborted{false};
  std::map<std::string, std::optional<std::string>> writes;
};

inline std::string to_string(const vouch::schema::bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()),
                     bytes.size()};
}

inline vouch::schema::bytes_t to_bytes(const std::string_view& value) {
  return {reinterpret_cast<const uint8_t*>(value.data()),
          reinterpret_cast<const uint8_t*>(value.data()) + value.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  std::unique_ptr<detail::write_overlay> overlay{
      std::make_unique<detail::write_overlay>()};

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const vouch::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const vouch::schema::bytes_view_t& key,
           const T& value);

  void erase(const vouch::schema::bytes_view_t& key);
  bool contains(const vouch::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const vouch::schema::bytes_view_t& prefix) const;

  std::optional<std::string> read_raw(const std::string& key) const;
  void write_raw(const std::string& key, std::optional<std::string> value);
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <>
class transaction_scope<rocksdb_storage_tag> final {
 public:
  explicit transaction_scope(storage<rocksdb_storage_tag>& store);
  ~transaction_scope();

  transaction_scope(const transaction_scope&) = delete;
  transaction_scope& operator=(const transaction_scope&) = delete;
  transaction_scope(transaction_scope&&) = delete;
  transaction_scope& operator=(transaction_scope&&) = delete;

  /// Returns false when an inner scope was abandoned; nothing is written in
  /// that case.
  bool commit();

 private:
  storage<rocksdb_storage_tag>& store_;
  std::unique_lock<std::recursive_mutex> lock_;
  bool done_{false};
};

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const vouch::schema::bytes_view_t& key) const {
  auto value = read_raw(detail::to_string(key));
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(vouch::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value->data()), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const vouch::schema::bytes_view_t& key,
                                       const T& value) {
  auto encoded = encoder.encode(value);
  write_raw(detail::to_string(key),
            std::string{reinterpret_cast<const char*>(encoded.data()),
                        encoded.size()});
}

}  // namespace vouch::storage
