#pragma once

#include <cstdint>
#include <unordered_set>

#include "config/config.pb.h"
#include "internal/cache/handle.hpp"

namespace chadoxml::cache {

class ObjectCache;

struct PolicyOutcome {
  std::uint64_t compressed = 0;
  std::uint64_t remaining  = 0; // materialized handles left
};

/*
  Decides which materialized handles to compress between stages.

    NEVER        keep everything materialized
    AFTER_STAGE  compress every handle that is not pinned
    THRESHOLD    compress least recently touched handles until at most
                 max_materialized remain

  Must only run while no caller holds an entity reference. The choice
  affects memory, never output.
*/
class CompressionPolicy {
 public:
  explicit CompressionPolicy(const chadoxml::runtime::config::CacheConfig& cfg);

  void Pin(Handle* handle);
  void Unpin(Handle* handle);

  PolicyOutcome Apply(ObjectCache& cache) const;

  chadoxml::runtime::config::CompressionPolicy Mode() const {
    return mode_;
  }

 private:
  chadoxml::runtime::config::CompressionPolicy mode_;
  std::uint64_t                                max_materialized_;
  std::unordered_set<const Handle*>            pinned_;
};

} // namespace chadoxml::cache
