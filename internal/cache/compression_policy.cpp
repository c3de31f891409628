#include "compression_policy.hpp"

#include <algorithm>
#include <vector>

#include "internal/cache/object_cache.hpp"

namespace chadoxml::cache {

namespace cfg = chadoxml::runtime::config;

CompressionPolicy::CompressionPolicy(const cfg::CacheConfig& config)
    : mode_(config.policy()), max_materialized_(config.max_materialized()) {
  if (mode_ == cfg::COMPRESSION_POLICY_UNSPECIFIED) mode_ = cfg::COMPRESSION_POLICY_NEVER;
}

void CompressionPolicy::Pin(Handle* handle) {
  pinned_.insert(handle);
}

void CompressionPolicy::Unpin(Handle* handle) {
  pinned_.erase(handle);
}

PolicyOutcome CompressionPolicy::Apply(ObjectCache& cache) const {
  PolicyOutcome outcome;

  std::vector<Handle*> candidates;
  for (Handle* h : cache.Handles()) {
    if (!h->IsMaterialized()) continue;
    if (pinned_.count(h) > 0) {
      ++outcome.remaining;
      continue;
    }
    candidates.push_back(h);
  }

  std::size_t budget = candidates.size();
  switch (mode_) {
    case cfg::COMPRESSION_POLICY_AFTER_STAGE:
      budget = 0;
      break;
    case cfg::COMPRESSION_POLICY_THRESHOLD: {
      // pinned handles count against the threshold too
      const auto limit = max_materialized_ > outcome.remaining ? max_materialized_ - outcome.remaining : 0;
      budget           = std::min<std::size_t>(candidates.size(), limit);
      std::sort(candidates.begin(), candidates.end(),
                [](const Handle* a, const Handle* b) { return a->LastTouch() < b->LastTouch(); });
      break;
    }
    default:
      break;
  }

  const std::size_t evict = candidates.size() - budget;
  for (std::size_t i = 0; i < evict; ++i) {
    cache.Compress(candidates[i]);
    ++outcome.compressed;
  }
  outcome.remaining += budget;
  return outcome;
}

} // namespace chadoxml::cache
