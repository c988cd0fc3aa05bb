#pragma once

#include <string>
#include <vector>

#include "internal/model/device_record.hpp"

namespace castproxy::store {

/*
  View of known receivers and their room assignment.

  ListByRoom is what the proxy consumes; Upsert exists for the discovery
  subsystem and for tooling. Read failures throw util::StoreUnavailable.
*/
class DeviceRegistry {
 public:
  virtual ~DeviceRegistry() = default;

  // Devices whose room equals `room` exactly. Unassigned devices never match.
  virtual std::vector<model::DeviceRecord> ListByRoom(const std::string& room) = 0;

  // Insert or merge by uuid. A record without a room keeps the stored one.
  virtual void Upsert(const model::DeviceRecord& record) = 0;
};

} // namespace castproxy::store
