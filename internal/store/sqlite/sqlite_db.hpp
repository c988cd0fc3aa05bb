#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace castproxy::store::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The connection is opened in serialized (FULLMUTEX) mode so the
  pairing store and device registry can share one handle across worker
  threads.
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

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Create the pairings/devices tables if missing.
  void Bootstrap();

 private:
  // Configure PRAGMAs (WAL, busy timeout)
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace castproxy::store::sqlite
