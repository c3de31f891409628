#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace chadoxml::storage {

/*
  Parking space for compressed entity payloads.

  The ObjectCache writes a payload when it compresses a handle and reads it
  back when the handle is materialized. Keys are handle keys ("Feature:F1").

  Implementations:
    RAM     → in-memory Arrow buffers
    SQLITE  → spill file, one row per payload
*/

class PayloadStore {
 public:
  virtual ~PayloadStore() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  /*
    Return the payload stored under key.

    Throws std::runtime_error when the key is absent.
  */
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& key) = 0;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Store or replace the payload under key.
  */
  virtual void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  /*
    Drop the payload under key. Absent keys are ignored.
  */
  virtual void Remove(const std::string& key) = 0;

  virtual bool Contains(const std::string& key) = 0;

  // Total payload bytes currently parked.
  virtual std::uint64_t BytesStored() = 0;

  virtual std::string_view Name() const = 0;
};

using PayloadStorePtr = std::shared_ptr<PayloadStore>;

} // namespace chadoxml::storage
