#pragma once

#include <mutex>
#include <string>

#include "internal/store/api/device_registry.hpp"

namespace castproxy::store::file {

/*
  Device registry over the discovery subsystem's devices.json:

    [ { "uuid": "...", "friendly_name": "...", "ip": "...",
        "last_seen": "...Z", "room": "101" | null } ]

  Reads re-parse the file each call. Upsert rewrites the whole document
  atomically; concurrent writers in other processes are not coordinated.
*/
class JsonDeviceRegistry final : public store::DeviceRegistry {
 public:
  explicit JsonDeviceRegistry(std::string path);

  std::vector<model::DeviceRecord> ListByRoom(const std::string& room) override;
  void                             Upsert(const model::DeviceRecord& record) override;

 private:
  std::vector<model::DeviceRecord> LoadAll(bool missing_is_empty);

  std::string path_;
  std::mutex  write_mutex_;
};

} // namespace castproxy::store::file
