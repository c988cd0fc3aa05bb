#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/firewall/firewall.hpp"

namespace castproxy::proxy {

/*
  Requests an allow rule for each (guest, device) pair that was answered.

  Best-effort: a failed install is logged and reported to the caller but
  never retracts the discovery answer. Without a configured firewall
  every request is a logged no-op.
*/
class FirewallSynchronizer {
 public:
  FirewallSynchronizer(std::shared_ptr<firewall::Firewall> firewall, std::chrono::seconds allow_ttl);

  bool Synchronize(const std::string& guest_address, const std::string& device_address);

  std::chrono::seconds AllowTtl() const {
    return allow_ttl_;
  }

 private:
  std::shared_ptr<firewall::Firewall> firewall_;
  std::chrono::seconds                allow_ttl_;
};

} // namespace castproxy::proxy
