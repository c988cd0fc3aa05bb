#include "sqlite_pairing_store.hpp"

#include "internal/util/errors.hpp"

namespace castproxy::store::sqlite {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

SqlitePairingStore::SqlitePairingStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::optional<model::PairingRecord> SqlitePairingStore::Lookup(const std::string& guest_address) {
  sqlite3_stmt* st = db_->Prepare("SELECT room,paired_at_ms,expires_at_ms,token_used FROM pairings WHERE guest_address=?;");

  BindText(st, 1, guest_address);

  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(st);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    std::string msg = sqlite3_errmsg(db_->Handle());
    sqlite3_finalize(st);
    throw util::StoreUnavailable("pairing lookup: " + msg);
  }

  model::PairingRecord r;
  r.guest_address = guest_address;
  r.room          = ColText(st, 0);
  r.paired_at     = util::FromUnixMillis(ColU64(st, 1));
  r.expires_at    = util::FromUnixMillis(ColU64(st, 2));
  r.token_used    = ColText(st, 3);

  sqlite3_finalize(st);
  return r;
}

void SqlitePairingStore::Put(const model::PairingRecord& record) {
  sqlite3_stmt* st = db_->Prepare(
      "INSERT INTO pairings(guest_address,room,paired_at_ms,expires_at_ms,token_used) VALUES(?,?,?,?,?) "
      "ON CONFLICT(guest_address) DO UPDATE SET room=excluded.room, paired_at_ms=excluded.paired_at_ms, "
      "expires_at_ms=excluded.expires_at_ms, token_used=excluded.token_used;");

  BindText(st, 1, record.guest_address);
  BindText(st, 2, record.room);
  BindU64(st, 3, util::ToUnixMillis(record.paired_at));
  BindU64(st, 4, util::ToUnixMillis(record.expires_at));
  BindText(st, 5, record.token_used);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) {
    throw util::StoreUnavailable("pairing write: " + std::string(sqlite3_errmsg(db_->Handle())));
  }
}

} // namespace castproxy::store::sqlite
