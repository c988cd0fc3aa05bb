#include "firewall_synchronizer.hpp"

#include "internal/observability/logging.hpp"

namespace castproxy::proxy {

using castproxy::observability::IntField;
using castproxy::observability::StringField;

FirewallSynchronizer::FirewallSynchronizer(std::shared_ptr<firewall::Firewall> firewall, std::chrono::seconds allow_ttl)
    : firewall_(std::move(firewall)), allow_ttl_(allow_ttl) {
}

bool FirewallSynchronizer::Synchronize(const std::string& guest_address, const std::string& device_address) {
  if (!firewall_) {
    CASTPROXY_LOG_DEBUG("no firewall configured, skipping allow rule", {StringField("guest", guest_address), StringField("device", device_address)});
    return true;
  }

  util::Result result;
  try {
    result = firewall_->Allow(guest_address, device_address, allow_ttl_);
  } catch (const std::exception& e) {
    result = util::Result::Err(util::ErrorCode::InternalError, e.what());
  }

  if (!result) {
    CASTPROXY_LOG_WARN("firewall allow failed",
                       {StringField("backend", firewall_->Name()), StringField("guest", guest_address), StringField("device", device_address),
                        StringField("error", result.message)});
    return false;
  }

  CASTPROXY_LOG_INFO("firewall allow installed", {StringField("backend", firewall_->Name()), StringField("guest", guest_address),
                                                  StringField("device", device_address), IntField("ttl_s", allow_ttl_.count())});
  return true;
}

} // namespace castproxy::proxy
