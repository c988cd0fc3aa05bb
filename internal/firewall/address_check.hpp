#pragma once

#include <arpa/inet.h>

#include <string>

namespace castproxy::firewall {

// Rule arguments are parsed by nft/ipset, so anything that is not a
// plain dotted quad is refused before it reaches a command line.
inline bool IsPlainIPv4(const std::string& address) {
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

} // namespace castproxy::firewall
