#include "object_cache.hpp"

#include <stdexcept>

namespace chadoxml::cache {

ObjectCache::ObjectCache(std::shared_ptr<const CodecRegistry>               codecs,
                         storage::PayloadStorePtr                           store,
                         std::shared_ptr<const storage::PayloadCompressor> compressor)
    : codecs_(std::move(codecs)), store_(std::move(store)), compressor_(std::move(compressor)) {
  if (!codecs_ || !store_ || !compressor_) {
    throw std::invalid_argument("ObjectCache requires codecs, payload store and compressor");
  }
}

void ObjectCache::EnsureAlive(const char* op) const {
  if (destroyed_) {
    throw util::LifecycleError(std::string(op) + " on destroyed object cache");
  }
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

Handle* ObjectCache::GetOrCreateLocked(model::EntityType type, const std::string& id) {
  auto key = Handle::MakeKey(type, id);
  auto it  = registry_.find(key);
  if (it != registry_.end()) return it->second.get();

  auto    handle = std::make_unique<Handle>(type, id);
  Handle* raw    = handle.get();
  registry_.emplace(std::move(key), std::move(handle));
  order_.push_back(raw);
  return raw;
}

Handle* ObjectCache::GetOrCreate(model::EntityType type, const std::string& id) {
  EnsureAlive("GetOrCreate");
  if (id.empty()) throw util::CacheConsistencyError("empty identifier for " + std::string(model::ToString(type)));

  std::unique_lock lock(registry_mutex_);
  return GetOrCreateLocked(type, id);
}

Handle* ObjectCache::Find(model::EntityType type, const std::string& id) const {
  EnsureAlive("Find");

  std::unique_lock lock(registry_mutex_);
  auto it = registry_.find(Handle::MakeKey(type, id));
  return it == registry_.end() ? nullptr : it->second.get();
}

std::string ObjectCache::NextId(model::EntityType type) {
  EnsureAlive("NextId");

  std::unique_lock lock(registry_mutex_);
  auto& counter = counters_[type];
  for (;;) {
    std::string id = std::string(model::ToString(type)) + "_" + std::to_string(++counter);
    if (registry_.find(Handle::MakeKey(type, id)) == registry_.end()) return id;
  }
}

std::vector<Handle*> ObjectCache::Handles() const {
  EnsureAlive("Handles");

  std::unique_lock lock(registry_mutex_);
  return order_;
}

// ------------------------------------------------------------------
// State transitions
// ------------------------------------------------------------------

Handle* ObjectCache::PutAny(model::EntityType type, std::string id, std::any entity) {
  EnsureAlive("Put");
  if (!codecs_->Contains(type)) {
    throw util::CacheConsistencyError("no codec registered for " + std::string(model::ToString(type)));
  }
  if (id.empty()) id = NextId(type);

  Handle* handle = nullptr;
  {
    std::unique_lock lock(registry_mutex_);
    handle = GetOrCreateLocked(type, id);
  }

  if (handle->parked_) {
    store_->Remove(handle->key_);
    handle->parked_ = false;
  }
  handle->entity_     = std::move(entity);
  handle->state_      = HandleState::kMaterialized;
  handle->registered_ = true;
  handle->last_touch_ = ++clock_;
  return handle;
}

std::any& ObjectCache::MaterializeAny(Handle* handle) {
  EnsureAlive("Materialize");
  if (handle == nullptr) throw util::CacheConsistencyError("materialize of null handle");

  handle->last_touch_ = ++clock_;
  if (handle->state_ == HandleState::kMaterialized) return handle->entity_;

  const auto& codec = codecs_->Get(handle->type_);

  std::string raw;
  if (handle->parked_) {
    try {
      auto frame = store_->Read(handle->key_);
      raw        = compressor_->Decompress(*frame);
    } catch (const std::exception& e) {
      throw util::CacheConsistencyError("cannot reconstruct " + handle->key_ + ": " + e.what());
    }
  }

  // Never-registered handles decode "" to a default entity.
  std::any entity = codec.Materialize(raw, *this);

  if (handle->parked_) {
    store_->Remove(handle->key_);
    handle->parked_ = false;
  }
  handle->entity_ = std::move(entity);
  handle->state_  = HandleState::kMaterialized;
  ++reconstructions_;
  return handle->entity_;
}

void ObjectCache::Compress(Handle* handle) {
  EnsureAlive("Compress");
  if (handle == nullptr) throw util::CacheConsistencyError("compress of null handle");
  if (handle->state_ == HandleState::kCompressed) return;

  const auto& codec = codecs_->Get(handle->type_);
  store_->Write(handle->key_, compressor_->Compress(codec.Compress(handle->entity_)));

  handle->parked_ = true;
  handle->entity_.reset();
  handle->state_ = HandleState::kCompressed;
  ++compressions_;
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

CacheStats ObjectCache::Stats() const {
  EnsureAlive("Stats");

  CacheStats stats;
  {
    std::unique_lock lock(registry_mutex_);
    stats.handles = order_.size();
    for (const Handle* h : order_) {
      if (h->registered_) ++stats.registered;
      if (h->state_ == HandleState::kMaterialized) ++stats.materialized;
    }
  }
  stats.parked_bytes    = store_->BytesStored();
  stats.compressions    = compressions_;
  stats.reconstructions = reconstructions_;
  return stats;
}

void ObjectCache::Destroy() {
  if (destroyed_) throw util::LifecycleError("object cache destroyed twice");

  std::unique_lock lock(registry_mutex_);
  for (Handle* h : order_) {
    if (h->parked_) store_->Remove(h->key_);
  }
  order_.clear();
  registry_.clear();
  counters_.clear();
  destroyed_ = true;
}

bool ObjectCache::IsDestroyed() const {
  return destroyed_;
}

} // namespace chadoxml::cache
