#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "internal/util/result.hpp"

namespace castproxy::net {

struct Endpoint {
  std::string address;  // dotted-quad IPv4
  uint16_t    port = 0;

  std::string ToString() const {
    return address + ":" + std::to_string(port);
  }
};

struct Datagram {
  std::vector<uint8_t> payload;
  Endpoint             source;
};

using DatagramHandler = std::function<void(Datagram)>;

/*
  Unicast reply path. The proxy only ever answers the querier directly;
  nothing it sends goes to the multicast group.
*/
class DatagramSender {
 public:
  virtual ~DatagramSender() = default;

  virtual util::Result SendTo(const Endpoint& destination, const std::vector<uint8_t>& payload) = 0;
};

} // namespace castproxy::net
