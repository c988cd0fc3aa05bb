#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/firewall/command_runner.hpp"
#include "internal/firewall/ipset_firewall.hpp"
#include "internal/firewall/nftables_firewall.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/file/json_device_registry.hpp"
#include "internal/store/file/json_pairing_store.hpp"
#include "internal/store/memory/memory_device_registry.hpp"
#include "internal/store/memory/memory_pairing_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if CASTPROXY_STORE_SQLITE
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_device_registry.hpp"
#include "internal/store/sqlite/sqlite_pairing_store.hpp"
#endif

namespace castproxy::factory {

using castproxy::observability::StringField;
using castproxy::runtime::config::FirewallConfig;
using castproxy::runtime::config::RuntimeConfig;
using castproxy::runtime::config::StoreConfig;

namespace {

#if CASTPROXY_STORE_SQLITE
std::shared_ptr<store::sqlite::SqliteDB> OpenSqlite(const std::string& path) {
  auto db = std::make_shared<store::sqlite::SqliteDB>(path);
  db->Bootstrap();
  return db;
}
#endif

} // namespace

std::shared_ptr<store::PairingStore> BuildPairingStore(const StoreConfig& config) {
  switch (config.backend_case()) {
    case StoreConfig::kFile:
      return std::make_shared<store::file::JsonPairingStore>(config.file().path());
    case StoreConfig::kSqlite:
#if CASTPROXY_STORE_SQLITE
      return std::make_shared<store::sqlite::SqlitePairingStore>(OpenSqlite(config.sqlite().path()));
#else
      throw util::InvalidConfig("sqlite pairing store requested but not enabled at build time");
#endif
    case StoreConfig::kMemory:
      CASTPROXY_LOG_WARN("pairing store is in-memory and starts empty; every guest is unauthorized");
      return std::make_shared<store::memory::MemoryPairingStore>();
    case StoreConfig::BACKEND_NOT_SET:
      break;
  }
  throw util::InvalidConfig("pairing_store backend not set");
}

std::shared_ptr<store::DeviceRegistry> BuildDeviceRegistry(const StoreConfig& config) {
  switch (config.backend_case()) {
    case StoreConfig::kFile:
      return std::make_shared<store::file::JsonDeviceRegistry>(config.file().path());
    case StoreConfig::kSqlite:
#if CASTPROXY_STORE_SQLITE
      return std::make_shared<store::sqlite::SqliteDeviceRegistry>(OpenSqlite(config.sqlite().path()));
#else
      throw util::InvalidConfig("sqlite device registry requested but not enabled at build time");
#endif
    case StoreConfig::kMemory:
      return std::make_shared<store::memory::MemoryDeviceRegistry>();
    case StoreConfig::BACKEND_NOT_SET:
      break;
  }
  throw util::InvalidConfig("device_registry backend not set");
}

std::shared_ptr<firewall::Firewall> BuildFirewall(const FirewallConfig& config) {
  const auto command_timeout = util::FromProto(config.command_timeout());
  auto       runner          = std::make_shared<firewall::ProcessRunner>();

  if (config.has_nftables()) {
    firewall::NftablesOptions options;
    options.family          = config.nftables().family();
    options.table           = config.nftables().table();
    options.set             = config.nftables().set();
    options.command_timeout = command_timeout;
    return std::make_shared<firewall::NftablesFirewall>(std::move(options), std::move(runner));
  }

  if (config.has_ipset()) {
    firewall::IpsetOptions options;
    options.set             = config.ipset().set();
    options.command_timeout = command_timeout;
    return std::make_shared<firewall::IpsetFirewall>(std::move(options), std::move(runner));
  }

  CASTPROXY_LOG_WARN("no firewall backend configured; answered guests get no allow rule");
  return nullptr;
}

proxy::DiscoveryProxyOptions ProxyOptionsFrom(const RuntimeConfig& config) {
  const auto& discovery = config.discovery();

  proxy::DiscoveryProxyOptions options;
  options.response.service_name    = discovery.service_name();
  options.response.record_ttl      = static_cast<uint32_t>(discovery.record_ttl().seconds());
  options.response.control_port    = static_cast<uint16_t>(discovery.control_port());
  options.response.instance_prefix = discovery.instance_prefix();
  options.response.model_name      = discovery.model_name();
  options.response.txt_version     = discovery.txt_version();
  options.response.icon_path       = discovery.icon_path();

  options.pairing_read_timeout  = util::FromProto(config.pairing_store().read_timeout());
  options.registry_read_timeout = util::FromProto(config.device_registry().read_timeout());

  options.pairing_max_outstanding  = config.pairing_store().max_outstanding_reads();
  options.registry_max_outstanding = config.device_registry().max_outstanding_reads();
  options.allow_ttl             = std::chrono::seconds(config.firewall().allow_ttl().seconds());
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Stores and firewall
  // ------------------------------------------------------------------
  app.pairings = BuildPairingStore(config.pairing_store());
  app.devices  = BuildDeviceRegistry(config.device_registry());
  app.firewall = BuildFirewall(config.firewall());

  // ------------------------------------------------------------------
  // Network
  // ------------------------------------------------------------------
  net::ListenerOptions listener_options;
  listener_options.interface_address  = config.listener().interface_address();
  listener_options.group              = config.listener().group();
  listener_options.port               = static_cast<uint16_t>(config.listener().port());
  listener_options.max_datagram_bytes = config.listener().max_datagram_bytes();
  app.listener                        = std::make_shared<net::MulticastListener>(std::move(listener_options));

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  proxy::DiscoveryProxyDeps deps;
  deps.pairings = app.pairings;
  deps.devices  = app.devices;
  deps.sender   = app.listener;
  deps.firewall = app.firewall;
  deps.clock    = util::Now;

  app.proxy   = std::make_shared<proxy::DiscoveryProxy>(std::move(deps), ProxyOptionsFrom(config));
  app.queue   = std::make_shared<dispatch::WorkQueue>(config.workers().max_pending());
  app.workers = std::make_shared<dispatch::WorkerPool>(app.queue, config.workers().threads());

  CASTPROXY_LOG_INFO("application built", {StringField("firewall", app.firewall ? app.firewall->Name() : "none"),
                                           StringField("service", config.discovery().service_name())});
  return app;
}

} // namespace castproxy::factory
