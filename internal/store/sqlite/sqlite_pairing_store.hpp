#pragma once

#include <memory>

#include "internal/store/api/pairing_store.hpp"
#include "sqlite_db.hpp"

namespace castproxy::store::sqlite {

class SqlitePairingStore final : public store::PairingStore {
 public:
  explicit SqlitePairingStore(std::shared_ptr<SqliteDB> db);

  std::optional<model::PairingRecord> Lookup(const std::string& guest_address) override;

  // Used by tooling and tests; the proxy itself never writes pairings.
  void Put(const model::PairingRecord& record);

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace castproxy::store::sqlite
