#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "internal/store/api/device_registry.hpp"

namespace castproxy::store::memory {

class MemoryDeviceRegistry final : public store::DeviceRegistry {
 public:
  std::vector<model::DeviceRecord> ListByRoom(const std::string& room) override;
  void                             Upsert(const model::DeviceRecord& record) override;

  std::vector<model::DeviceRecord> ListAll();

 private:
  std::mutex mutex_;
  // insertion order is kept so answers come out in registration order
  std::vector<model::DeviceRecord> devices_;
};

} // namespace castproxy::store::memory
