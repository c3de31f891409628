#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/payload_store.hpp"

namespace chadoxml::storage {

/*
  RAM payload store.

  Backed by Arrow buffers held in a map.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamPayloadStore final : public PayloadStore {
 public:
  RamPayloadStore()           = default;
  ~RamPayloadStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  void Remove(const std::string& key) override;

  bool Contains(const std::string& key) override;

  std::uint64_t BytesStored() override;

  std::string_view Name() const override {
    return "ram";
  }

 private:
  mutable std::shared_mutex                                       mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
  std::uint64_t                                                   bytes_ = 0;
};

} // namespace chadoxml::storage
