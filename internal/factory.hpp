#pragma once

#include <memory>

#include "castproxy/config/config.pb.h"
#include "internal/dispatch/worker_pool.hpp"
#include "internal/firewall/firewall.hpp"
#include "internal/net/multicast_listener.hpp"
#include "internal/proxy/discovery_proxy.hpp"
#include "internal/store/api/device_registry.hpp"
#include "internal/store/api/pairing_store.hpp"

namespace castproxy::factory {

/*
  Everything the daemon keeps alive for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<store::PairingStore>   pairings;
  std::shared_ptr<store::DeviceRegistry> devices;
  std::shared_ptr<firewall::Firewall>    firewall;  // null when not configured

  std::shared_ptr<net::MulticastListener> listener;
  std::shared_ptr<dispatch::WorkQueue>    queue;
  std::shared_ptr<dispatch::WorkerPool>   workers;
  std::shared_ptr<proxy::DiscoveryProxy>  proxy;
};

/*
  Composition root: the only place that knows concrete store and
  firewall types. Nothing is started here.
*/
Application Build(const castproxy::runtime::config::RuntimeConfig& config);

std::shared_ptr<store::PairingStore>   BuildPairingStore(const castproxy::runtime::config::StoreConfig& config);
std::shared_ptr<store::DeviceRegistry> BuildDeviceRegistry(const castproxy::runtime::config::StoreConfig& config);
std::shared_ptr<firewall::Firewall>    BuildFirewall(const castproxy::runtime::config::FirewallConfig& config);

proxy::DiscoveryProxyOptions ProxyOptionsFrom(const castproxy::runtime::config::RuntimeConfig& config);

} // namespace castproxy::factory
