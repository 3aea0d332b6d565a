#include <spdlog/spdlog.h>
#include <warden/audit/audit_log.hpp>
#include <warden/blake3/hash.hpp>
#include <warden/schema/key/keys.hpp>

#include <algorithm>

using namespace warden::schema;

namespace warden::audit {

namespace {

bool matches(const audit_record_t& record, const audit_filter_t& filter) {
  if (filter.principal_id && record.principal_id != *filter.principal_id) {
    return false;
  }
  if (filter.action_kind && record.action_kind != *filter.action_kind) {
    return false;
  }
  if (filter.outcome && record.outcome != *filter.outcome) {
    return false;
  }
  if (filter.event && record.event != *filter.event) {
    return false;
  }
  if (filter.from && record.recorded_at < *filter.from) {
    return false;
  }
  if (filter.to && record.recorded_at > *filter.to) {
    return false;
  }
  return true;
}

}  // namespace

audit_log::audit_log(
    encoding::encoder<encoding::scale_encoder_tag>& encoder,
    warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage,
    settings config,
    warden::common::time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      settings_{config},
      clock_{std::move(clock)} {
  auto prefix = key::make_prefix(key::kAuditPrefix);
  auto last = storage_.last_by_prefix(make_bytes_view(prefix));
  if (last) {
    auto record = encoder_.try_decode<audit_record_t>(
        make_bytes_view(last->second));
    if (!record) {
      warden::common::critical("failed to decode the latest audit record");
    }
    next_sequence_ = record->sequence + 1;
    head_hash_ = record->hash;
    spdlog::info("Audit log resumed at sequence {}", next_sequence_);
  }
  writer_ = std::thread{[this] { run(); }};
}

audit_log::~audit_log() {
  close();
}

hash32_t audit_log::compute_hash(const audit_record_t& record) const {
  auto unsealed = record;
  unsealed.hash = make_zero_hash();
  auto encoded = encoder_.encode(unsealed);
  return warden::blake3::hash(make_bytes_view(encoded));
}

bool audit_log::append(audit_record_t record) {
  auto lock = std::unique_lock{mutex_};
  auto admitted = not_full_.wait_for(lock, settings_.submit_timeout, [this] {
    return closed_ || faulted_ || queue_.size() < settings_.queue_capacity;
  });
  if (!admitted) {
    spdlog::error("Audit queue full; rejecting record for '{}'",
                  record.action_kind);
    return false;
  }
  if (closed_ || faulted_) {
    return false;
  }

  if (record.recorded_at == 0) {
    record.recorded_at = clock_();
  }
  record.version = 1;
  record.sequence = next_sequence_;
  record.previous_hash = head_hash_;
  record.hash = compute_hash(record);

  ++next_sequence_;
  head_hash_ = record.hash;
  queue_.push_back(std::move(record));
  not_empty_.notify_one();
  return true;
}

void audit_log::run() {
  while (true) {
    auto record = audit_record_t{};
    {
      auto lock = std::unique_lock{mutex_};
      not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      record = std::move(queue_.front());
      queue_.pop_front();
      ++in_flight_;
      not_full_.notify_one();
    }

    auto storage_key = key::make_audit_key(record.sequence);
    auto written = storage_.try_put(encoder_, make_bytes_view(storage_key), record);
    if (!written) {
      spdlog::warn("Retrying audit write for sequence {}", record.sequence);
      written = storage_.try_put(encoder_, make_bytes_view(storage_key), record);
    }

    auto lock = std::scoped_lock{mutex_};
    --in_flight_;
    if (!written) {
      spdlog::error("Audit record {} could not be persisted; audit log faulted",
                    record.sequence);
      faulted_ = true;
      not_full_.notify_all();
    }
    drained_.notify_all();
  }
}

void audit_log::flush() {
  auto lock = std::unique_lock{mutex_};
  drained_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

std::vector<audit_record_t> audit_log::load_all() {
  auto prefix = key::make_prefix(key::kAuditPrefix);
  auto entries = storage_.list_by_prefix(make_bytes_view(prefix));
  auto records = std::vector<audit_record_t>{};
  records.reserve(entries.size());
  for (const auto& [entry_key, value] : entries) {
    auto record = encoder_.try_decode<audit_record_t>(make_bytes_view(value));
    if (!record) {
      spdlog::error("Undecodable audit record under key of {} bytes",
                    entry_key.size());
      continue;
    }
    records.push_back(std::move(*record));
  }
  return records;
}

std::vector<audit_record_t> audit_log::query(const audit_filter_t& filter) {
  flush();
  auto records = load_all();
  auto selected = std::vector<audit_record_t>{};
  std::ranges::copy_if(records, std::back_inserter(selected),
                       [&](const auto& r) { return matches(r, filter); });
  if (filter.limit && selected.size() > *filter.limit) {
    selected.erase(std::begin(selected),
                   std::end(selected) -
                       static_cast<std::ptrdiff_t>(*filter.limit));
  }
  return selected;
}

chain_report_t audit_log::verify_chain() {
  flush();
  auto report = chain_report_t{};
  auto prefix = key::make_prefix(key::kAuditPrefix);
  auto entries = storage_.list_by_prefix(make_bytes_view(prefix));

  auto previous = std::optional<audit_record_t>{};
  for (const auto& [entry_key, value] : entries) {
    auto sequence =
        key::parse_sequence(make_bytes_view(entry_key), key::kAuditPrefix);
    auto record = encoder_.try_decode<audit_record_t>(make_bytes_view(value));
    if (!sequence || !record || record->sequence != *sequence) {
      report.intact = false;
      report.broken_at = sequence.value_or(0);
      return report;
    }
    auto linked = !previous || (record->sequence == previous->sequence + 1 &&
                                record->previous_hash == previous->hash);
    if (!linked || compute_hash(*record) != record->hash) {
      report.intact = false;
      report.broken_at = record->sequence;
      spdlog::error("Audit chain broken at sequence {}", record->sequence);
      return report;
    }
    ++report.checked;
    previous = std::move(record);
  }
  return report;
}

std::size_t audit_log::prune_before(const timestamp_milliseconds_t cutoff) {
  flush();
  auto prefix = key::make_prefix(key::kAuditPrefix);
  auto entries = storage_.list_by_prefix(make_bytes_view(prefix));

  auto doomed = std::vector<bytes_t>{};
  for (const auto& [entry_key, value] : entries) {
    auto record = encoder_.try_decode<audit_record_t>(make_bytes_view(value));
    if (!record || record->recorded_at >= cutoff) {
      break;
    }
    doomed.push_back(entry_key);
  }
  if (doomed.empty()) {
    return 0;
  }
  if (!storage_.remove(doomed)) {
    spdlog::error("Failed to prune {} audit records", doomed.size());
    return 0;
  }
  spdlog::info("Pruned {} audit records older than {}", doomed.size(), cutoff);
  return doomed.size();
}

std::size_t audit_log::apply_retention() {
  auto now = clock_();
  auto cutoff = now > settings_.retention ? now - settings_.retention : 0;
  auto pruned = prune_before(cutoff);
  if (pruned > 0) {
    auto recorded = append(
        audit_record_t{.event = audit_event_type_t::retention,
                       .principal_id = "system",
                       .outcome = audit_outcome_t::granted,
                       .reason = "pruned " + std::to_string(pruned) +
                                 " records"});
    if (!recorded) {
      spdlog::error("Failed to record audit retention of {} records", pruned);
    }
  }
  return pruned;
}

void audit_log::close() {
  {
    auto lock = std::scoped_lock{mutex_};
    if (closed_ && !writer_.joinable()) {
      return;
    }
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
  if (writer_.joinable()) {
    writer_.join();
  }
}

bool audit_log::faulted() const {
  auto lock = std::scoped_lock{mutex_};
  return faulted_;
}

uint64_t audit_log::next_sequence() const {
  auto lock = std::scoped_lock{mutex_};
  return next_sequence_;
}

}  // namespace warden::audit
