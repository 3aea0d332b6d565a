#pragma once

#include <warden/schema/call_summary.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace warden::call {

/// Persistent, append-only history of auto-answered calls.
class call_archive final {
 public:
  call_archive(
      warden::schema::encoding::encoder<
          warden::schema::encoding::scale_encoder_tag>& encoder,
      warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage);

  /// Assign the next sequence number and persist. Returns the sequence, or
  /// std::nullopt when the write failed.
  std::optional<uint64_t> store(warden::schema::call_summary_t summary);

  /// Most recent `limit` calls, oldest first. Zero means all of them.
  std::vector<warden::schema::call_summary_t> list(std::size_t limit) const;

  std::optional<warden::schema::call_summary_t> find(uint64_t sequence) const;

 private:
  warden::schema::encoding::encoder<warden::schema::encoding::scale_encoder_tag>&
      encoder_;
  warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage_;
  mutable std::mutex mutex_;
  uint64_t next_sequence_{};
};

}  // namespace warden::call
