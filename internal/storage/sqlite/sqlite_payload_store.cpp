#include "sqlite_payload_store.hpp"

#include <cstring>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"

namespace chadoxml::storage {

using sqlite::Statement;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

SqlitePayloadStore::SqlitePayloadStore(std::shared_ptr<sqlite::SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("DROP TABLE IF EXISTS payload;");
  db_->Exec("CREATE TABLE payload (key TEXT PRIMARY KEY, bytes BLOB NOT NULL);");
}

std::shared_ptr<arrow::Buffer> SqlitePayloadStore::Read(const std::string& key) {
  Statement st = db_->Prepare("SELECT bytes FROM payload WHERE key = ?;");
  BindText(st.get(), 1, key);

  const int rc = sqlite3_step(st.get());
  db_->Check(rc, "read payload");
  if (rc != SQLITE_ROW) throw std::runtime_error("spilled payload not found: " + key);

  const auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(st.get(), 0));
  const auto  size = static_cast<std::int64_t>(sqlite3_column_bytes(st.get(), 0));

  std::shared_ptr<arrow::Buffer> buffer = common::Unwrap(arrow::AllocateBuffer(size));
  if (size > 0) std::memcpy(buffer->mutable_data(), blob, static_cast<size_t>(size));
  return buffer;
}

void SqlitePayloadStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  Statement st = db_->Prepare("INSERT OR REPLACE INTO payload(key, bytes) VALUES(?, ?);");
  BindText(st.get(), 1, key);
  // zero-length blobs must still be non-NULL
  sqlite3_bind_blob(st.get(), 2, buffer->size() > 0 ? buffer->data() : reinterpret_cast<const std::uint8_t*>(""),
                    static_cast<int>(buffer->size()), SQLITE_TRANSIENT);
  db_->Check(sqlite3_step(st.get()), "write payload");
}

void SqlitePayloadStore::Remove(const std::string& key) {
  Statement st = db_->Prepare("DELETE FROM payload WHERE key = ?;");
  BindText(st.get(), 1, key);
  db_->Check(sqlite3_step(st.get()), "remove payload");
}

bool SqlitePayloadStore::Contains(const std::string& key) {
  Statement st = db_->Prepare("SELECT 1 FROM payload WHERE key = ?;");
  BindText(st.get(), 1, key);
  const int rc = sqlite3_step(st.get());
  db_->Check(rc, "lookup payload");
  return rc == SQLITE_ROW;
}

std::uint64_t SqlitePayloadStore::BytesStored() {
  Statement st = db_->Prepare("SELECT COALESCE(SUM(LENGTH(bytes)), 0) FROM payload;");
  db_->Check(sqlite3_step(st.get()), "payload size");
  return static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 0));
}

} // namespace chadoxml::storage
