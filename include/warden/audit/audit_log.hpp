#pragma once

#include <warden/common/clock.hpp>
#include <warden/schema/audit_record.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace warden::audit {

struct chain_report_t final {
  bool intact{true};
  std::size_t checked{};
  std::optional<uint64_t> broken_at;
};

/// Append-only, hash-chained record of security decisions.
///
/// `append` assigns the sequence number and chain hash under a short lock and
/// hands the record to a bounded queue; a single writer thread persists it.
/// Readers call `flush` first so that queries see every record appended
/// before the call.
class audit_log final {
 public:
  struct settings final {
    std::size_t queue_capacity{1024};
    warden::schema::duration_milliseconds_t retention{30ull * 24 * 60 * 60 *
                                                      1000};
    std::chrono::milliseconds submit_timeout{250};
  };

  audit_log(
      warden::schema::encoding::encoder<
          warden::schema::encoding::scale_encoder_tag>& encoder,
      warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage,
      settings config,
      warden::common::time_source_t clock);
  ~audit_log();

  audit_log(const audit_log&) = delete;
  audit_log& operator=(const audit_log&) = delete;

  /// Enqueue `record`. Sequence, hashes and (when unset) `recorded_at` are
  /// filled in here. Returns false when the log is closed, has seen a storage
  /// failure, or the queue stayed full for `submit_timeout`.
  bool append(warden::schema::audit_record_t record);

  /// Matching records in sequence order; `limit` keeps the most recent.
  std::vector<warden::schema::audit_record_t> query(
      const warden::schema::audit_filter_t& filter);

  /// Block until every queued record has been written.
  void flush();

  /// Recompute every stored hash and check sequence continuity.
  chain_report_t verify_chain();

  /// Delete the oldest records recorded before `cutoff`. The chain stays
  /// verifiable from the first surviving record.
  std::size_t prune_before(warden::schema::timestamp_milliseconds_t cutoff);

  /// `prune_before(now - retention)`, itself recorded as a retention event.
  std::size_t apply_retention();

  /// Stop accepting records, drain the queue and join the writer.
  void close();

  bool faulted() const;
  uint64_t next_sequence() const;

 private:
  void run();
  warden::schema::hash32_t compute_hash(
      const warden::schema::audit_record_t& record) const;
  std::vector<warden::schema::audit_record_t> load_all();

  warden::schema::encoding::encoder<warden::schema::encoding::scale_encoder_tag>&
      encoder_;
  warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage_;
  settings settings_;
  warden::common::time_source_t clock_;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::condition_variable drained_;
  std::deque<warden::schema::audit_record_t> queue_;
  std::size_t in_flight_{};
  uint64_t next_sequence_{};
  warden::schema::hash32_t head_hash_{};
  bool closed_{false};
  bool faulted_{false};
  std::thread writer_;
};

}  // namespace warden::audit
