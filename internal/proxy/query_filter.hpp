#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/mdns/dns_message.hpp"

namespace castproxy::proxy {

struct MatchedQuery {
  uint16_t       id = 0;
  mdns::Question question;  // the first question asking for the service
};

/*
  Decides whether a datagram is a discovery query for the proxied service.

  Relevant means: a standard query (QR clear, opcode 0) with at least one
  PTR question whose name equals the service name, compared
  case-insensitively. Other questions in the same packet are ignored.
*/
class QueryFilter {
 public:
  explicit QueryFilter(std::string service_name);

  // Decodes and classifies. Throws util::MalformedPacket on decode failure.
  std::optional<MatchedQuery> Classify(const std::vector<uint8_t>& payload) const;

  std::optional<MatchedQuery> Match(const mdns::Message& message) const;

  const std::string& ServiceName() const {
    return service_name_;
  }

 private:
  std::string service_name_;
};

} // namespace castproxy::proxy
