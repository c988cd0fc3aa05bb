#include "ipset_firewall.hpp"

#include "address_check.hpp"

namespace castproxy::firewall {

IpsetFirewall::IpsetFirewall(IpsetOptions options, std::shared_ptr<CommandRunner> runner)
    : options_(std::move(options)), runner_(std::move(runner)) {
}

std::vector<std::string> IpsetFirewall::BuildCommand(const std::string& guest_address, const std::string& device_address,
                                                     std::chrono::seconds ttl) const {
  return {"ipset", "-exist", "add", options_.set, guest_address + "," + device_address, "timeout", std::to_string(ttl.count())};
}

util::Result IpsetFirewall::Allow(const std::string& guest_address, const std::string& device_address, std::chrono::seconds ttl) {
  if (!IsPlainIPv4(guest_address) || !IsPlainIPv4(device_address)) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, "refusing non-IPv4 rule " + guest_address + " -> " + device_address);
  }
  if (ttl.count() <= 0) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, "rule lifetime must be positive");
  }
  return runner_->Run(BuildCommand(guest_address, device_address, ttl), options_.command_timeout);
}

} // namespace castproxy::firewall
