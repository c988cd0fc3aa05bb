#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

#include "internal/net/datagram.hpp"

namespace castproxy::net {

struct ListenerOptions {
  // Address of the guest-segment interface; the group is joined here only.
  std::string interface_address;
  std::string group = "224.0.0.251";
  uint16_t    port  = 5353;

  size_t max_datagram_bytes = 9000;
};

/*
  Owns the mDNS socket on the guest segment.

  - Binds the wildcard address on the mDNS port and joins the group on
    the configured interface only. IP_MULTICAST_ALL is cleared so group
    traffic joined by other sockets on other interfaces is not
    delivered here, and datagrams that arrive on any other interface
    (checked with IP_PKTINFO) are dropped.
  - The receive thread hands every datagram to the handler and goes
    straight back to recvmsg; the handler must not block.
  - Replies go out by unicast from the same socket, so they carry
    source port 5353 as queriers expect.
*/
class MulticastListener final : public DatagramSender {
 public:
  explicit MulticastListener(ListenerOptions options);
  ~MulticastListener() override;

  MulticastListener(const MulticastListener&)            = delete;
  MulticastListener& operator=(const MulticastListener&) = delete;

  void SetHandler(DatagramHandler handler);

  // Throws std::runtime_error if the socket cannot be set up.
  void Start();

  // Leaves the group and closes the socket. Idempotent.
  void Stop();

  // The port actually bound; differs from options.port only when that is 0.
  uint16_t Port() const {
    return bound_port_;
  }

  util::Result SendTo(const Endpoint& destination, const std::vector<uint8_t>& payload) override;

 private:
  void OpenSocket();
  void CloseSocket();
  void Run();

  ListenerOptions options_;
  DatagramHandler handler_;

  std::atomic<int> sockfd_{-1};
  unsigned int     interface_index_ = 0;
  uint16_t         bound_port_      = 0;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace castproxy::net
