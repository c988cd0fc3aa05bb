#pragma once

#include <memory>
#include <string>
#include <vector>

#include "command_runner.hpp"
#include "firewall.hpp"

namespace castproxy::firewall {

struct NftablesOptions {
  std::string family = "inet";
  std::string table  = "castproxy";
  // set of type `ipv4_addr . ipv4_addr` with the `timeout` flag
  std::string set = "guest_device_allow";

  std::chrono::milliseconds command_timeout{5000};
};

/*
  Adds (guest . device) elements to an nftables set:

    nft add element inet castproxy guest_device_allow { 10.0.20.5 . 10.0.30.9 timeout 43200s }

  `add` on an existing element is accepted by nft, which gives the
  idempotence the proxy relies on. The forward chain that consults the
  set is provisioned outside this process.
*/
class NftablesFirewall final : public Firewall {
 public:
  NftablesFirewall(NftablesOptions options, std::shared_ptr<CommandRunner> runner);

  util::Result Allow(const std::string& guest_address, const std::string& device_address, std::chrono::seconds ttl) override;

  std::string Name() const override {
    return "nftables";
  }

  std::vector<std::string> BuildCommand(const std::string& guest_address, const std::string& device_address, std::chrono::seconds ttl) const;

 private:
  NftablesOptions                options_;
  std::shared_ptr<CommandRunner> runner_;
};

} // namespace castproxy::firewall
