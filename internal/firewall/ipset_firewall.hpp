#pragma once

#include <memory>
#include <string>
#include <vector>

#include "command_runner.hpp"
#include "firewall.hpp"

namespace castproxy::firewall {

struct IpsetOptions {
  // set of type hash:ip,ip created with `timeout 0` defaults
  std::string set = "castproxy_allow";

  std::chrono::milliseconds command_timeout{5000};
};

/*
  Adds guest,device pairs to an ipset:

    ipset -exist add castproxy_allow 10.0.20.5,10.0.30.9 timeout 43200

  -exist turns a duplicate add into a timeout refresh instead of an error.
*/
class IpsetFirewall final : public Firewall {
 public:
  IpsetFirewall(IpsetOptions options, std::shared_ptr<CommandRunner> runner);

  util::Result Allow(const std::string& guest_address, const std::string& device_address, std::chrono::seconds ttl) override;

  std::string Name() const override {
    return "ipset";
  }

  std::vector<std::string> BuildCommand(const std::string& guest_address, const std::string& device_address, std::chrono::seconds ttl) const;

 private:
  IpsetOptions                   options_;
  std::shared_ptr<CommandRunner> runner_;
};

} // namespace castproxy::firewall
