#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace chadoxml::storage::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3* for the payload spill file.

  The spill file is scratch space: it is truncated on open and durability
  pragmas are relaxed.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Throws with the connection's error message unless rc is one of the success codes.
  void Check(int rc, const char* what) const;

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace chadoxml::storage::sqlite
