#include "discovery_proxy.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/mdns/mdns_constants.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace castproxy::proxy {

using castproxy::observability::IntField;
using castproxy::observability::StringField;

const char* ToString(Disposition disposition) {
  switch (disposition) {
    case Disposition::Malformed:
      return "malformed";
    case Disposition::Irrelevant:
      return "irrelevant";
    case Disposition::Unauthorized:
      return "unauthorized";
    case Disposition::NoDevices:
      return "no_devices";
    case Disposition::Answered:
      return "answered";
  }
  return "unknown";
}

DiscoveryProxy::DiscoveryProxy(DiscoveryProxyDeps deps, DiscoveryProxyOptions options)
    : devices_(std::move(deps.devices)),
      sender_(std::move(deps.sender)),
      clock_(deps.clock ? std::move(deps.clock) : util::ClockFn(util::Now)),
      registry_reads_("device registry", options.registry_read_timeout, options.registry_max_outstanding),
      filter_(options.response.service_name),
      resolver_(std::move(deps.pairings), options.pairing_read_timeout, options.pairing_max_outstanding),
      builder_(options.response),
      synchronizer_(std::move(deps.firewall), options.allow_ttl) {
  if (!devices_ || !sender_) {
    throw std::invalid_argument("DiscoveryProxy requires a device registry and a sender");
  }
}

std::vector<model::DeviceRecord> DiscoveryProxy::DevicesInRoom(const std::string& room) const {
  try {
    auto registry = devices_;
    return registry_reads_.Call([registry, room] { return registry->ListByRoom(room); });
  } catch (const std::exception& e) {
    CASTPROXY_LOG_WARN("device registry unreadable, answering nothing", {StringField("room", room), StringField("error", e.what())});
    return {};
  }
}

HandleOutcome DiscoveryProxy::Handle(const net::Datagram& datagram) {
  HandleOutcome     outcome;
  const std::string guest = datagram.source.address;

  // ------------------------------------------------------------------
  // Filter
  // ------------------------------------------------------------------
  std::optional<MatchedQuery> query;
  try {
    query = filter_.Classify(datagram.payload);
  } catch (const util::MalformedPacket& e) {
    CASTPROXY_LOG_DEBUG("dropping malformed datagram", {StringField("source", datagram.source.ToString()), StringField("error", e.what())});
    outcome.disposition = Disposition::Malformed;
    return outcome;
  }
  if (!query) {
    outcome.disposition = Disposition::Irrelevant;
    return outcome;
  }

  // ------------------------------------------------------------------
  // Authorize
  // ------------------------------------------------------------------
  const auto authorization = resolver_.Resolve(guest, clock_());
  if (!authorization) {
    outcome.disposition = Disposition::Unauthorized;
    return outcome;
  }

  // ------------------------------------------------------------------
  // Room devices
  // ------------------------------------------------------------------
  auto devices = DevicesInRoom(authorization->room);
  // registry adapters filter already; re-check so a loose backend cannot widen the set
  devices.erase(std::remove_if(devices.begin(), devices.end(),
                               [&](const model::DeviceRecord& d) { return !d.room || *d.room != authorization->room; }),
                devices.end());
  outcome.devices_matched = devices.size();
  if (devices.empty()) {
    CASTPROXY_LOG_INFO("no devices in room", {StringField("guest", guest), StringField("room", authorization->room)});
    outcome.disposition = Disposition::NoDevices;
    return outcome;
  }

  // ------------------------------------------------------------------
  // Answer, one packet per device
  // ------------------------------------------------------------------
  ReplyContext reply;
  if (datagram.source.port != mdns::kMdnsPort) {
    reply.id              = query->id;
    reply.echoed_question = query->question;
    reply.ttl_cap         = mdns::kLegacyUnicastMaxTtl;
  }

  outcome.disposition = Disposition::Answered;
  for (const auto& device : devices) {
    const auto message = builder_.Build(device, reply);
    if (!message) {
      CASTPROXY_LOG_WARN("device has no usable IPv4 address, skipping", {StringField("uuid", device.uuid), StringField("ip", device.ip)});
      continue;
    }

    std::vector<uint8_t> packet;
    try {
      packet = mdns::Encode(*message);
    } catch (const std::exception& e) {
      CASTPROXY_LOG_WARN("cannot encode answer", {StringField("uuid", device.uuid), StringField("error", e.what())});
      continue;
    }

    const auto sent = sender_->SendTo(datagram.source, packet);
    if (!sent) {
      CASTPROXY_LOG_WARN("unicast answer failed",
                         {StringField("guest", datagram.source.ToString()), StringField("uuid", device.uuid), StringField("error", sent.message)});
      continue;
    }
    ++outcome.responses_sent;

    CASTPROXY_LOG_INFO("answered discovery query", {StringField("guest", datagram.source.ToString()), StringField("room", authorization->room),
                                                    StringField("uuid", device.uuid), StringField("instance", builder_.InstanceLabel(device.uuid)),
                                                    IntField("bytes", static_cast<int64_t>(packet.size()))});

    if (!synchronizer_.Synchronize(guest, device.ip)) {
      ++outcome.firewall_failures;
    }
  }

  return outcome;
}

} // namespace castproxy::proxy
