#pragma once

#include <chrono>
#include <string>

#include "internal/util/result.hpp"

namespace castproxy::firewall {

/*
  Capability to open a time-bounded path from a guest to a device.

  Allow must be idempotent: re-installing an existing (guest, device)
  entry succeeds. Expiry is the rule store's own business; callers never
  remove entries.
*/
class Firewall {
 public:
  virtual ~Firewall() = default;

  virtual util::Result Allow(const std::string& guest_address, const std::string& device_address, std::chrono::seconds ttl) = 0;

  // Short backend name for logs.
  virtual std::string Name() const = 0;
};

} // namespace castproxy::firewall
