#include "json_device_registry.hpp"

#include <google/protobuf/util/json_util.h>

#include <filesystem>

#include "castproxy/store/store.pb.h"
#include "internal/util/errors.hpp"
#include "json_document.hpp"

namespace castproxy::store::file {

namespace {

model::DeviceRecord FromEntry(const castproxy::store::v1::DeviceEntry& entry) {
  model::DeviceRecord record;
  record.uuid          = entry.uuid();
  record.friendly_name = entry.friendly_name();
  record.ip            = entry.ip();
  record.last_seen     = util::FromProto(entry.last_seen());
  if (!entry.room().empty()) {
    record.room = entry.room();
  }
  return record;
}

castproxy::store::v1::DeviceEntry ToEntry(const model::DeviceRecord& record) {
  castproxy::store::v1::DeviceEntry entry;
  entry.set_uuid(record.uuid);
  entry.set_friendly_name(record.friendly_name);
  entry.set_ip(record.ip);
  *entry.mutable_last_seen() = util::ToProto(record.last_seen);
  if (record.room) {
    entry.set_room(*record.room);
  }
  return entry;
}

} // namespace

JsonDeviceRegistry::JsonDeviceRegistry(std::string path) : path_(std::move(path)) {
}

std::vector<model::DeviceRecord> JsonDeviceRegistry::LoadAll(bool missing_is_empty) {
  if (missing_is_empty && !std::filesystem::exists(path_)) {
    return {};
  }

  castproxy::store::v1::DeviceFile document;
  ParseWrapped(path_, "devices", ReadDocument(path_), &document);

  std::vector<model::DeviceRecord> devices;
  devices.reserve(document.devices_size());
  for (const auto& entry : document.devices()) {
    devices.push_back(FromEntry(entry));
  }
  return devices;
}

std::vector<model::DeviceRecord> JsonDeviceRegistry::ListByRoom(const std::string& room) {
  std::vector<model::DeviceRecord> matches;
  for (auto& device : LoadAll(false)) {
    if (device.room && *device.room == room) {
      matches.push_back(std::move(device));
    }
  }
  return matches;
}

void JsonDeviceRegistry::Upsert(const model::DeviceRecord& record) {
  std::lock_guard lock(write_mutex_);

  // a corrupt document throws here instead of being overwritten
  auto devices = LoadAll(true);

  bool merged = false;
  for (auto& device : devices) {
    if (device.uuid == record.uuid) {
      device = model::MergeDevice(device, record);
      merged = true;
      break;
    }
  }
  if (!merged) {
    devices.push_back(record);
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string document = "[";
  for (size_t i = 0; i < devices.size(); ++i) {
    std::string json;
    auto        status = google::protobuf::util::MessageToJsonString(ToEntry(devices[i]), &json, options);
    if (!status.ok()) {
      throw util::StoreUnavailable("cannot serialize device " + devices[i].uuid + ": " + std::string(status.message()));
    }
    document += (i == 0 ? "\n" : ",\n") + json;
  }
  document += "]\n";

  WriteDocument(path_, document);
}

} // namespace castproxy::store::file
