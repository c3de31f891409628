#include "ram_payload_store.hpp"

#include <stdexcept>

namespace chadoxml::storage {

std::shared_ptr<arrow::Buffer> RamPayloadStore::Read(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) throw std::runtime_error("RAM payload not found: " + key);

  return it->second;
}

void RamPayloadStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  std::unique_lock lock(mutex_);

  auto& slot = buffers_[key];
  if (slot) bytes_ -= static_cast<std::uint64_t>(slot->size());
  slot = buffer;
  bytes_ += static_cast<std::uint64_t>(buffer->size());
}

void RamPayloadStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) return;

  bytes_ -= static_cast<std::uint64_t>(it->second->size());
  buffers_.erase(it);
}

bool RamPayloadStore::Contains(const std::string& key) {
  std::shared_lock lock(mutex_);
  return buffers_.count(key) > 0;
}

std::uint64_t RamPayloadStore::BytesStored() {
  std::shared_lock lock(mutex_);
  return bytes_;
}

} // namespace chadoxml::storage
