#pragma once

#include <memory>

#include "internal/store/api/device_registry.hpp"
#include "sqlite_db.hpp"

namespace castproxy::store::sqlite {

class SqliteDeviceRegistry final : public store::DeviceRegistry {
 public:
  explicit SqliteDeviceRegistry(std::shared_ptr<SqliteDB> db);

  std::vector<model::DeviceRecord> ListByRoom(const std::string& room) override;
  void                             Upsert(const model::DeviceRecord& record) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace castproxy::store::sqlite
