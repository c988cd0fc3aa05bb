#include "sqlite_device_registry.hpp"

#include "internal/util/errors.hpp"

namespace castproxy::store::sqlite {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

SqliteDeviceRegistry::SqliteDeviceRegistry(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::vector<model::DeviceRecord> SqliteDeviceRegistry::ListByRoom(const std::string& room) {
  // `room = ?` never matches NULL, so unassigned devices drop out here
  sqlite3_stmt* st = db_->Prepare("SELECT uuid,friendly_name,ip,room,last_seen_ms FROM devices WHERE room=? ORDER BY rowid;");

  BindText(st, 1, room);

  std::vector<model::DeviceRecord> devices;
  int                              rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    model::DeviceRecord r;
    r.uuid          = ColText(st, 0);
    r.friendly_name = ColText(st, 1);
    r.ip            = ColText(st, 2);
    r.room          = ColText(st, 3);
    r.last_seen     = util::FromUnixMillis(static_cast<uint64_t>(sqlite3_column_int64(st, 4)));
    devices.push_back(std::move(r));
  }

  if (rc != SQLITE_DONE) {
    std::string msg = sqlite3_errmsg(db_->Handle());
    sqlite3_finalize(st);
    throw util::StoreUnavailable("device listing: " + msg);
  }

  sqlite3_finalize(st);
  return devices;
}

void SqliteDeviceRegistry::Upsert(const model::DeviceRecord& record) {
  // COALESCE keeps an assigned room when the update carries none
  sqlite3_stmt* st = db_->Prepare(
      "INSERT INTO devices(uuid,friendly_name,ip,room,last_seen_ms) VALUES(?,?,?,?,?) "
      "ON CONFLICT(uuid) DO UPDATE SET friendly_name=excluded.friendly_name, ip=excluded.ip, "
      "room=COALESCE(excluded.room, devices.room), last_seen_ms=excluded.last_seen_ms;");

  BindText(st, 1, record.uuid);
  BindText(st, 2, record.friendly_name);
  BindText(st, 3, record.ip);
  if (record.room) {
    BindText(st, 4, *record.room);
  } else {
    sqlite3_bind_null(st, 4);
  }
  sqlite3_bind_int64(st, 5, static_cast<sqlite3_int64>(util::ToUnixMillis(record.last_seen)));

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) {
    throw util::StoreUnavailable("device upsert: " + std::string(sqlite3_errmsg(db_->Handle())));
  }
}

} // namespace castproxy::store::sqlite
