#include <vouch/common/critical.hpp>
#include <vouch/storage/rocksdb/storage.hpp>

#include <utility>

namespace vouch::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    vouch::common::critical("Failed to open RocksDB at {}: {}", path,
                            status.ToString());
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<std::string> storage<rocksdb_storage_tag>::read_raw(
    const std::string& key) const {
  if (!database) {
    vouch::common::critical("RocksDB database is not initialized");
  }
  auto lock = std::scoped_lock{overlay->mutex};
  if (auto pending = overlay->writes.find(key);
      pending != std::end(overlay->writes)) {
    return pending->second;
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, key, &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    vouch::common::critical("Failed to get value from RocksDB: {}",
                            status.ToString());
  }
  return value;
}

void storage<rocksdb_storage_tag>::write_raw(const std::string& key,
                                             std::optional<std::string> value) {
  if (!database) {
    vouch::common::critical("RocksDB database is not initialized");
  }
  auto lock = std::scoped_lock{overlay->mutex};
  if (overlay->depth > 0) {
    overlay->writes[key] = std::move(value);
    return;
  }
  auto status = value ? database->Put(ROCKSDB_NAMESPACE::WriteOptions{}, key,
                                      *value)
                      : database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                         key);
  if (!status.ok()) {
    vouch::common::critical("Failed to write RocksDB: {}", status.ToString());
  }
}

void storage<rocksdb_storage_tag>::erase(
    const vouch::schema::bytes_view_t& key) {
  write_raw(detail::to_string(key), std::nullopt);
}

bool storage<rocksdb_storage_tag>::contains(
    const vouch::schema::bytes_view_t& key) const {
  return read_raw(detail::to_string(key)).has_value();
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const vouch::schema::bytes_view_t& prefix) const {
  if (!database) {
    vouch::common::critical("RocksDB database is not initialized");
  }
  auto lock = std::scoped_lock{overlay->mutex};
  auto prefix_string = detail::to_string(prefix);

  auto merged = std::map<std::string, std::string>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    merged.emplace(iterator->key().ToString(), iterator->value().ToString());
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    vouch::common::critical("Failed iterating RocksDB: {}",
                            iterator->status().ToString());
  }

  for (auto it = overlay->writes.lower_bound(prefix_string);
       it != std::end(overlay->writes) && it->first.starts_with(prefix_string);
       ++it) {
    if (it->second) {
      merged[it->first] = *it->second;
    } else {
      merged.erase(it->first);
    }
  }

  auto entries = std::vector<key_value_entry_t>{};
  entries.reserve(merged.size());
  for (const auto& [key, value] : merged) {
    entries.push_back(
        key_value_entry_t{detail::to_bytes(key), detail::to_bytes(value)});
  }
  return entries;
}

transaction_scope<rocksdb_storage_tag>::transaction_scope(
    storage<rocksdb_storage_tag>& store)
    : store_{store}, lock_{store.overlay->mutex} {
  ++store_.overlay->depth;
}

transaction_scope<rocksdb_storage_tag>::~transaction_scope() {
  if (done_) {
    return;
  }
  auto& overlay = *store_.overlay;
  --overlay.depth;
  if (overlay.depth > 0) {
    overlay.aborted = true;
    return;
  }
  if (!overlay.writes.empty()) {
    spdlog::debug("Discarding {} uncommitted writes", overlay.writes.size());
  }
  overlay.writes.clear();
  overlay.aborted = false;
}

bool transaction_scope<rocksdb_storage_tag>::commit() {
  if (done_) {
    return false;
  }
  done_ = true;
  auto& overlay = *store_.overlay;
  --overlay.depth;
  if (overlay.depth > 0) {
    return !overlay.aborted;
  }

  auto aborted = std::exchange(overlay.aborted, false);
  auto writes = std::exchange(overlay.writes, {});
  if (aborted) {
    spdlog::warn("Transaction rolled back: an inner scope was abandoned");
    return false;
  }
  if (writes.empty()) {
    return true;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto status = value ? batch.Put(key, *value) : batch.Delete(key);
    if (!status.ok()) {
      vouch::common::critical("Failed staging write batch: {}",
                              status.ToString());
    }
  }
  auto status = store_.database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    vouch::common::critical("Failed to commit write batch: {}",
                            status.ToString());
  }
  return true;
}

}  // namespace vouch::storage
