#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <warden/common/critical.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace warden::storage {

namespace detail {

inline warden::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const warden::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

/// Smallest key strictly greater than every key carrying `prefix`.
inline std::optional<std::string> prefix_upper_bound(std::string prefix) {
  while (!prefix.empty()) {
    auto& last = prefix.back();
    if (static_cast<uint8_t>(last) != 0xFF) {
      last = static_cast<char>(static_cast<uint8_t>(last) + 1);
      return prefix;
    }
    prefix.pop_back();
  }
  return std::nullopt;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const warden::schema::bytes_view_t& key,
           const T& value) const;

  template <typename T, typename Encoder>
  bool try_put(Encoder& encoder,
               const warden::schema::bytes_view_t& key,
               const T& value) const;

  bool remove(const std::vector<warden::schema::bytes_t>& keys) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
  std::optional<key_value_entry_t> last_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const warden::schema::bytes_view_t& key) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      warden::common::critical("Failed to get value from RocksDB");
    }
  }
  return encoder.template try_decode<T>(warden::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const warden::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!try_put(encoder, key, value)) {
    warden::common::critical("Failed to put value into RocksDB");
  }
}

template <typename T, typename Encoder>
bool storage<rocksdb_storage_tag>::try_put(
    Encoder& encoder,
    const warden::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(warden::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    return false;
  }
  return true;
}

}  // namespace warden::storage
