#include "config_loader.hpp"

#include <arpa/inet.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace castproxy::config {

using castproxy::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("5353" must not become a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  // an empty document is an empty config, not a null one
  if (json_value.kind_case() == google::protobuf::Value::kNullValue) {
    json_value.mutable_struct_value();
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

static void DefaultDuration(google::protobuf::Duration* d, int64_t seconds) {
  if (d->seconds() == 0 && d->nanos() == 0) {
    d->set_seconds(seconds);
  }
}

static bool IsIpv4(const std::string& address) {
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

static void ValidateStore(const castproxy::runtime::config::StoreConfig& store, const std::string& name) {
  switch (store.backend_case()) {
    case castproxy::runtime::config::StoreConfig::kFile:
      if (store.file().path().empty()) throw util::InvalidConfig(name + ".file.path is required");
      break;
    case castproxy::runtime::config::StoreConfig::kSqlite:
      if (store.sqlite().path().empty()) throw util::InvalidConfig(name + ".sqlite.path is required");
      break;
    case castproxy::runtime::config::StoreConfig::kMemory:
      break;
    case castproxy::runtime::config::StoreConfig::BACKEND_NOT_SET:
      throw util::InvalidConfig(name + " requires one of: file, sqlite, memory");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* listener = config.mutable_listener();
  if (listener->group().empty()) listener->set_group("224.0.0.251");
  if (listener->port() == 0) listener->set_port(5353);
  if (listener->max_datagram_bytes() == 0) listener->set_max_datagram_bytes(9000);

  auto* discovery = config.mutable_discovery();
  if (discovery->service_name().empty()) discovery->set_service_name("_googlecast._tcp.local");
  DefaultDuration(discovery->mutable_record_ttl(), 120);
  if (discovery->control_port() == 0) discovery->set_control_port(8009);
  if (discovery->instance_prefix().empty()) discovery->set_instance_prefix("Chromecast");
  if (discovery->model_name().empty()) discovery->set_model_name("Chromecast");
  if (discovery->txt_version().empty()) discovery->set_txt_version("05");
  if (discovery->icon_path().empty()) discovery->set_icon_path("/setup/icon.png");

  DefaultDuration(config.mutable_pairing_store()->mutable_read_timeout(), 2);
  DefaultDuration(config.mutable_device_registry()->mutable_read_timeout(), 2);
  for (auto* store : {config.mutable_pairing_store(), config.mutable_device_registry()}) {
    if (store->max_outstanding_reads() == 0) store->set_max_outstanding_reads(4);
  }

  auto* firewall = config.mutable_firewall();
  DefaultDuration(firewall->mutable_allow_ttl(), 12 * 60 * 60);
  DefaultDuration(firewall->mutable_command_timeout(), 5);
  if (firewall->has_nftables()) {
    auto* nft = firewall->mutable_nftables();
    if (nft->family().empty()) nft->set_family("inet");
    if (nft->table().empty()) nft->set_table("castproxy");
    if (nft->set().empty()) nft->set_set("guest_device_allow");
  }
  if (firewall->has_ipset() && firewall->ipset().set().empty()) {
    firewall->mutable_ipset()->set_set("castproxy_allow");
  }

  auto* workers = config.mutable_workers();
  if (workers->threads() == 0) workers->set_threads(4);
  if (workers->max_pending() == 0) workers->set_max_pending(256);

  if (config.logging().level().empty()) config.mutable_logging()->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& listener = config.listener();
  if (listener.interface_address().empty()) {
    throw util::InvalidConfig("listener.interface_address is required");
  }
  if (!IsIpv4(listener.interface_address())) {
    throw util::InvalidConfig("listener.interface_address is not an IPv4 address: " + listener.interface_address());
  }
  if (!IsIpv4(listener.group())) {
    throw util::InvalidConfig("listener.group is not an IPv4 address: " + listener.group());
  }
  if (listener.port() > 65535) {
    throw util::InvalidConfig("listener.port out of range");
  }

  const auto& discovery = config.discovery();
  if (discovery.record_ttl().seconds() <= 0) {
    throw util::InvalidConfig("discovery.record_ttl must be at least one second");
  }
  if (discovery.control_port() > 65535) {
    throw util::InvalidConfig("discovery.control_port out of range");
  }

  ValidateStore(config.pairing_store(), "pairing_store");
  ValidateStore(config.device_registry(), "device_registry");

  if (config.firewall().allow_ttl().seconds() <= 0) {
    throw util::InvalidConfig("firewall.allow_ttl must be at least one second");
  }
  if (config.workers().threads() == 0) {
    throw util::InvalidConfig("workers.threads must be positive");
  }
}

} // namespace castproxy::config
