#pragma once

#include <memory>
#include <string>

#include "internal/storage/payload_store.hpp"
#include "internal/storage/sqlite/sqlite_db.hpp"

namespace chadoxml::storage {

/*
  Spill store: compressed payloads live in an SQLite file instead of RAM.

  Schema:
      payload(key TEXT PRIMARY KEY, bytes BLOB NOT NULL)
*/
class SqlitePayloadStore final : public PayloadStore {
 public:
  explicit SqlitePayloadStore(std::shared_ptr<sqlite::SqliteDB> db);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  void Remove(const std::string& key) override;

  bool Contains(const std::string& key) override;

  std::uint64_t BytesStored() override;

  std::string_view Name() const override {
    return "sqlite";
  }

 private:
  std::shared_ptr<sqlite::SqliteDB> db_;
};

} // namespace chadoxml::storage
