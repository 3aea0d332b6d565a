#include <warden/common/critical.hpp>
#include <warden/storage/rocksdb/storage.hpp>

namespace warden::storage {

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
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    warden::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::remove(
    const std::vector<warden::schema::bytes_t>& keys) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : keys) {
    auto status = batch.Delete(detail::to_slice(key));
    if (!status.ok()) {
      spdlog::error("Failed to stage RocksDB delete: {}", status.ToString());
      return false;
    }
  }
  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to delete keys from RocksDB: {}", status.ToString());
    return false;
  }
  return true;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const warden::schema::bytes_view_t& prefix) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = warden::schema::make_string(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    warden::common::critical("RocksDB iteration failed");
  }
  return entries;
}

std::optional<key_value_entry_t> storage<rocksdb_storage_tag>::last_by_prefix(
    const warden::schema::bytes_view_t& prefix) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }

  auto prefix_string = warden::schema::make_string(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  auto upper = detail::prefix_upper_bound(prefix_string);
  if (upper) {
    iterator->SeekForPrev(*upper);
    if (iterator->Valid() &&
        std::string_view{iterator->key().data(), iterator->key().size()} ==
            *upper) {
      iterator->Prev();
    }
  } else {
    iterator->SeekToLast();
  }
  if (!iterator->Valid()) {
    return std::nullopt;
  }
  auto key_view =
      std::string_view{iterator->key().data(), iterator->key().size()};
  if (!key_view.starts_with(prefix_string)) {
    return std::nullopt;
  }
  return key_value_entry_t{detail::to_bytes(iterator->key()),
                           detail::to_bytes(iterator->value())};
}

}  // namespace warden::storage
