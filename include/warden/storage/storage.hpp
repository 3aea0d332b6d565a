#pragma once
#include <warden/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace warden::storage {

using key_value_entry_t =
    std::pair<warden::schema::bytes_t, warden::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key) const;

  /// Encode and persist value at key; a backend failure is fatal.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const warden::schema::bytes_view_t& key,
           const T& value) const;

  /// Encode and persist value at key; returns false on a backend failure.
  template <typename T, typename Encoder>
  bool try_put(Encoder& encoder,
               const warden::schema::bytes_view_t& key,
               const T& value) const;

  /// Delete the given keys in one batch.
  bool remove(const std::vector<warden::schema::bytes_t>& keys) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;

  /// Return the greatest key-value pair under prefix.
  std::optional<key_value_entry_t> last_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace warden::storage
