#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/mdns/dns_message.hpp"
#include "internal/model/device_record.hpp"

namespace castproxy::proxy {

struct ResponseOptions {
  std::string service_name    = "_googlecast._tcp.local";
  uint32_t    record_ttl      = 120;
  uint16_t    control_port    = 8009;
  std::string instance_prefix = "Chromecast";
  std::string model_name      = "Chromecast";
  std::string txt_version     = "05";
  std::string icon_path       = "/setup/icon.png";
};

// How the querier expects to be answered.
struct ReplyContext {
  uint16_t                      id = 0;
  std::optional<mdns::Question> echoed_question;
  std::optional<uint32_t>       ttl_cap;
};

/*
  Builds the answer message advertising one device:

    answer     PTR  <service>                  -> <label>.<service>
    additional TXT  <label>.<service>          id= fn= md= ve= ic=
    additional SRV  <label>.<service>          0 0 <control_port> <label>.local
    additional A    <label>.local              <device ip>

  The label depends on the uuid only, so a device keeps its identity
  across rename, readdressing and room reassignment.
*/
class ResponseBuilder {
 public:
  explicit ResponseBuilder(ResponseOptions options);

  std::string InstanceLabel(const std::string& uuid) const;

  std::string InstanceName(const std::string& uuid) const;

  // nullopt when the device address is not usable in an A record
  std::optional<mdns::Message> Build(const model::DeviceRecord& device, const ReplyContext& reply) const;

  const ResponseOptions& Options() const {
    return options_;
  }

 private:
  ResponseOptions options_;
};

} // namespace castproxy::proxy
