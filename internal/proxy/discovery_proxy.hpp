#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/net/datagram.hpp"
#include "internal/proxy/authorization_resolver.hpp"
#include "internal/proxy/firewall_synchronizer.hpp"
#include "internal/proxy/query_filter.hpp"
#include "internal/proxy/response_builder.hpp"
#include "internal/store/api/device_registry.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/time.hpp"

namespace castproxy::proxy {

enum class Disposition {
  Malformed,
  Irrelevant,
  Unauthorized,
  NoDevices,
  Answered,
};

const char* ToString(Disposition disposition);

struct HandleOutcome {
  Disposition disposition       = Disposition::Irrelevant;
  size_t      devices_matched   = 0;
  size_t      responses_sent    = 0;
  size_t      firewall_failures = 0;
};

struct DiscoveryProxyDeps {
  std::shared_ptr<store::PairingStore>   pairings;
  std::shared_ptr<store::DeviceRegistry> devices;
  std::shared_ptr<net::DatagramSender>   sender;
  std::shared_ptr<firewall::Firewall>    firewall;  // may be null

  util::ClockFn clock = util::Now;
};

struct DiscoveryProxyOptions {
  ResponseOptions           response;
  std::chrono::milliseconds pairing_read_timeout{2000};
  std::chrono::milliseconds registry_read_timeout{2000};
  size_t                    pairing_max_outstanding  = 4;
  size_t                    registry_max_outstanding = 4;
  std::chrono::seconds      allow_ttl{12 * 60 * 60};
};

/*
  Per-datagram pipeline:

    filter -> authorize -> list room devices -> build -> unicast -> allow

  Each stage may end the flow early. Nothing is ever sent to a guest that
  is not currently paired, and answers only ever go back to the querier's
  own address and port.

  Handle is safe to call concurrently; it holds no locks across I/O.
*/
class DiscoveryProxy {
 public:
  DiscoveryProxy(DiscoveryProxyDeps deps, DiscoveryProxyOptions options);

  HandleOutcome Handle(const net::Datagram& datagram);

 private:
  std::vector<model::DeviceRecord> DevicesInRoom(const std::string& room) const;

  std::shared_ptr<store::DeviceRegistry> devices_;
  std::shared_ptr<net::DatagramSender>   sender_;
  util::ClockFn                          clock_;
  util::DeadlineCaller                   registry_reads_;

  QueryFilter           filter_;
  AuthorizationResolver resolver_;
  ResponseBuilder       builder_;
  FirewallSynchronizer  synchronizer_;
};

} // namespace castproxy::proxy
