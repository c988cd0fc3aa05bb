#pragma once

#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace castproxy::model {

/*
  A known cast receiver on the device segment.

  uuid is the dedup key. room is unset until assigned; an upsert that
  carries no room leaves an existing assignment alone.
*/
struct DeviceRecord {
  std::string uuid;
  std::string friendly_name;
  std::string ip;

  std::optional<std::string> room;

  util::TimePoint last_seen{};
};

// Folds a discovery update into the stored record. Identity and address
// fields follow the update; the room only changes when the update names one.
inline DeviceRecord MergeDevice(const DeviceRecord& stored, const DeviceRecord& update) {
  DeviceRecord merged = update;
  if (!merged.room) {
    merged.room = stored.room;
  }
  return merged;
}

} // namespace castproxy::model
