#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace longform::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opened in serialized (FULLMUTEX) mode; one handle is shared by the
  repository and every transaction.
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

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

  const std::string& Path() const {
    return path_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace longform::db::sqlite
