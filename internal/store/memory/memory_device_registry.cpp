#include "memory_device_registry.hpp"

namespace castproxy::store::memory {

std::vector<model::DeviceRecord> MemoryDeviceRegistry::ListByRoom(const std::string& room) {
  std::lock_guard                  lock(mutex_);
  std::vector<model::DeviceRecord> matches;
  for (const auto& device : devices_) {
    if (device.room && *device.room == room) {
      matches.push_back(device);
    }
  }
  return matches;
}

void MemoryDeviceRegistry::Upsert(const model::DeviceRecord& record) {
  std::lock_guard lock(mutex_);
  for (auto& device : devices_) {
    if (device.uuid == record.uuid) {
      device = model::MergeDevice(device, record);
      return;
    }
  }
  devices_.push_back(record);
}

std::vector<model::DeviceRecord> MemoryDeviceRegistry::ListAll() {
  std::lock_guard lock(mutex_);
  return devices_;
}

} // namespace castproxy::store::memory
