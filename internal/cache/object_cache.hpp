#pragma once

#include <any>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/cache/entity_codec.hpp"
#include "internal/cache/handle.hpp"
#include "internal/model/entity_type.hpp"
#include "internal/storage/payload_compressor.hpp"
#include "internal/storage/payload_store.hpp"
#include "internal/util/errors.hpp"

namespace chadoxml::cache {

struct CacheStats {
  std::uint64_t handles           = 0;
  std::uint64_t registered        = 0;
  std::uint64_t materialized      = 0;
  std::uint64_t parked_bytes      = 0;
  std::uint64_t compressions      = 0;
  std::uint64_t reconstructions   = 0;
};

/*
  Owns every handle and the parked payloads behind them.

  One handle exists per (type, identifier) for the cache's lifetime. A
  handle is either materialized (entity held in memory) or compressed
  (entity encoded by its codec and parked in the payload store). A handle
  created by GetOrCreate without a Put materializes to a default entity.

  The registry map is guarded by a mutex; handle state is driven from a
  single thread at a time.
*/
class ObjectCache {
 public:
  ObjectCache(std::shared_ptr<const CodecRegistry>               codecs,
              storage::PayloadStorePtr                           store,
              std::shared_ptr<const storage::PayloadCompressor> compressor);

  ObjectCache(const ObjectCache&)            = delete;
  ObjectCache& operator=(const ObjectCache&) = delete;

  Handle* GetOrCreate(model::EntityType type, const std::string& id);

  // nullptr if no handle exists.
  Handle* Find(model::EntityType type, const std::string& id) const;

  // Registers entity under id, generating one when id is empty.
  template <typename T>
  Handle* Put(std::string id, T entity) {
    return PutAny(T::kType, std::move(id), std::any(std::move(entity)));
  }

  template <typename T>
  T& Materialize(Handle* handle) {
    EnsureAlive("Materialize");
    if (handle != nullptr && handle->Type() != T::kType) {
      throw util::CacheConsistencyError("handle " + handle->Key() + " is not a " +
                                        std::string(model::ToString(T::kType)));
    }
    return std::any_cast<T&>(MaterializeAny(handle));
  }

  std::any& MaterializeAny(Handle* handle);

  // No-op for handles already compressed.
  void Compress(Handle* handle);

  // Fresh "TypeName_n" identifier not yet in use.
  std::string NextId(model::EntityType type);

  // Snapshot in creation order.
  std::vector<Handle*> Handles() const;

  const CodecRegistry& Codecs() const {
    return *codecs_;
  }

  CacheStats Stats() const;

  // Releases every handle and payload. Must be called exactly once.
  void Destroy();

  bool IsDestroyed() const;

 private:
  Handle* PutAny(model::EntityType type, std::string id, std::any entity);
  Handle* GetOrCreateLocked(model::EntityType type, const std::string& id);
  void    EnsureAlive(const char* op) const;

  std::shared_ptr<const CodecRegistry>               codecs_;
  storage::PayloadStorePtr                           store_;
  std::shared_ptr<const storage::PayloadCompressor> compressor_;

  mutable std::mutex                                       registry_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Handle>> registry_;
  std::vector<Handle*>                                     order_;
  std::unordered_map<model::EntityType, std::uint64_t>     counters_;

  std::uint64_t clock_           = 0;
  std::uint64_t compressions_    = 0;
  std::uint64_t reconstructions_ = 0;
  bool          destroyed_       = false;

};

} // namespace chadoxml::cache
