#include <spdlog/spdlog.h>
#include <warden/call/call_archive.hpp>
#include <warden/schema/key/keys.hpp>

using namespace warden::schema;

namespace warden::call {

call_archive::call_archive(
    encoding::encoder<encoding::scale_encoder_tag>& encoder,
    warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder}, storage_{storage} {
  auto prefix = key::make_prefix(key::kCallSummaryPrefix);
  auto last = storage_.last_by_prefix(make_bytes_view(prefix));
  if (last) {
    auto sequence = key::parse_sequence(make_bytes_view(last->first),
                                        key::kCallSummaryPrefix);
    if (sequence) {
      next_sequence_ = *sequence + 1;
    }
  }
}

std::optional<uint64_t> call_archive::store(call_summary_t summary) {
  auto lock = std::scoped_lock{mutex_};
  summary.sequence = next_sequence_;
  auto storage_key = key::make_call_summary_key(summary.sequence);
  if (!storage_.try_put(encoder_, make_bytes_view(storage_key), summary)) {
    spdlog::error("Failed to archive call from '{}'", summary.caller);
    return std::nullopt;
  }
  ++next_sequence_;
  return summary.sequence;
}

std::vector<call_summary_t> call_archive::list(const std::size_t limit) const {
  auto prefix = key::make_prefix(key::kCallSummaryPrefix);
  auto entries = storage_.list_by_prefix(make_bytes_view(prefix));
  auto first = limit > 0 && entries.size() > limit ? entries.size() - limit : 0;
  auto out = std::vector<call_summary_t>{};
  for (auto i = first; i < entries.size(); ++i) {
    auto summary =
        encoder_.try_decode<call_summary_t>(make_bytes_view(entries[i].second));
    if (!summary) {
      spdlog::warn("Skipping undecodable call summary");
      continue;
    }
    out.push_back(std::move(*summary));
  }
  return out;
}

std::optional<call_summary_t> call_archive::find(const uint64_t sequence) const {
  auto storage_key = key::make_call_summary_key(sequence);
  return storage_.get<call_summary_t>(encoder_, make_bytes_view(storage_key));
}

}  // namespace warden::call
