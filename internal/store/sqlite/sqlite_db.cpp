#include "sqlite_db.hpp"

#include <vector>

#include "internal/util/errors.hpp"

namespace castproxy::store::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StoreUnavailable(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreUnavailable(path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StoreUnavailable(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // WAL lets the pairing API write while the proxy reads
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // short: a blocked read is a failed read to the proxy
  ThrowIf(sqlite3_busy_timeout(db_, 1000), db_, "busy_timeout");
}

void SqliteDB::Bootstrap() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS pairings (guest_address TEXT PRIMARY KEY, room TEXT NOT NULL, paired_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, token_used TEXT);",
      "CREATE TABLE IF NOT EXISTS devices (uuid TEXT PRIMARY KEY, friendly_name TEXT NOT NULL, ip TEXT NOT NULL, room TEXT, last_seen_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS devices_by_room ON devices(room);"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }
}

} // namespace castproxy::store::sqlite
