#include "multicast_listener.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"

namespace castproxy::net {

using castproxy::observability::IntField;
using castproxy::observability::StringField;

namespace {

constexpr int kPollIntervalMs = 250;

std::string ErrnoText(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

// Maps the configured interface address to its ifindex.
unsigned int InterfaceIndexFor(const in_addr& address) {
  struct ifaddrs* ifas = nullptr;
  if (getifaddrs(&ifas) != 0) {
    throw std::runtime_error(ErrnoText("getifaddrs"));
  }

  unsigned int index = 0;
  for (auto* ifa = ifas; ifa != nullptr; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
    const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
    if (sin->sin_addr.s_addr == address.s_addr) {
      index = if_nametoindex(ifa->ifa_name);
      break;
    }
  }
  freeifaddrs(ifas);

  if (index == 0) {
    char text[INET_ADDRSTRLEN]{};
    inet_ntop(AF_INET, &address, text, sizeof(text));
    throw std::runtime_error(std::string("no local interface has address ") + text);
  }
  return index;
}

} // namespace

MulticastListener::MulticastListener(ListenerOptions options) : options_(std::move(options)) {
}

MulticastListener::~MulticastListener() {
  Stop();
}

void MulticastListener::SetHandler(DatagramHandler handler) {
  handler_ = std::move(handler);
}

void MulticastListener::Start() {
  if (running_) return;
  if (!handler_) {
    throw std::runtime_error("MulticastListener started without a handler");
  }

  OpenSocket();
  running_ = true;
  thread_  = std::thread(&MulticastListener::Run, this);

  CASTPROXY_LOG_INFO("mDNS listener started",
                     {StringField("group", options_.group), IntField("port", bound_port_),
                      StringField("interface", options_.interface_address), IntField("ifindex", interface_index_)});
}

void MulticastListener::Stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  CloseSocket();
  if (was_running) {
    CASTPROXY_LOG_INFO("mDNS listener stopped");
  }
}

void MulticastListener::OpenSocket() {
  in_addr iface{};
  if (inet_pton(AF_INET, options_.interface_address.c_str(), &iface) != 1) {
    throw std::runtime_error("invalid interface address: " + options_.interface_address);
  }
  in_addr group{};
  if (inet_pton(AF_INET, options_.group.c_str(), &group) != 1) {
    throw std::runtime_error("invalid multicast group: " + options_.group);
  }

  interface_index_ = InterfaceIndexFor(iface);

  // CLOEXEC keeps the socket out of forked firewall commands
  const int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    throw std::runtime_error(ErrnoText("cannot open mDNS socket"));
  }
  sockfd_ = fd;

  auto fail = [this](const std::string& what) {
    const std::string msg = ErrnoText(what);
    CloseSocket();
    throw std::runtime_error(msg);
  };

  int on = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) fail("SO_REUSEADDR");
#ifdef SO_REUSEPORT
  // coexist with a system mDNS responder bound to the same port
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &on, sizeof(on)) < 0) fail("SO_REUSEPORT");
#endif
  if (::setsockopt(fd, IPPROTO_IP, IP_PKTINFO, &on, sizeof(on)) < 0) fail("IP_PKTINFO");

#ifdef IP_MULTICAST_ALL
  int off = 0;
  if (::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_ALL, &off, sizeof(off)) < 0) fail("IP_MULTICAST_ALL");
#endif

  sockaddr_in local{};
  local.sin_family      = AF_INET;
  local.sin_port        = htons(options_.port);
  local.sin_addr.s_addr = htonl(INADDR_ANY);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) fail("bind mDNS port");

  if (options_.port == 0) {
    socklen_t len = sizeof(local);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) < 0) fail("getsockname");
  }
  bound_port_ = ntohs(local.sin_port);

  ip_mreq membership{};
  membership.imr_multiaddr = group;
  membership.imr_interface = iface;
  if (::setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) < 0) fail("IP_ADD_MEMBERSHIP");
}

void MulticastListener::CloseSocket() {
  const int fd = sockfd_.exchange(-1);
  if (fd < 0) return;

  in_addr iface{};
  in_addr group{};
  if (inet_pton(AF_INET, options_.interface_address.c_str(), &iface) == 1 && inet_pton(AF_INET, options_.group.c_str(), &group) == 1) {
    ip_mreq membership{};
    membership.imr_multiaddr = group;
    membership.imr_interface = iface;
    ::setsockopt(fd, IPPROTO_IP, IP_DROP_MEMBERSHIP, &membership, sizeof(membership));
  }

  ::shutdown(fd, SHUT_RDWR);
  ::close(fd);
}

void MulticastListener::Run() {
  std::vector<uint8_t> buffer(options_.max_datagram_bytes);
  char                 control[CMSG_SPACE(sizeof(in_pktinfo))];

  while (running_) {
    pollfd pfd{};
    pfd.fd     = sockfd_.load();
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) continue;
      CASTPROXY_LOG_ERROR("mDNS poll failed", {StringField("error", std::strerror(errno))});
      break;
    }
    if (ready == 0) continue;

    sockaddr_in source{};
    iovec       iov{buffer.data(), buffer.size()};
    msghdr      msg{};
    msg.msg_name       = &source;
    msg.msg_namelen    = sizeof(source);
    msg.msg_iov        = &iov;
    msg.msg_iovlen     = 1;
    msg.msg_control    = control;
    msg.msg_controllen = sizeof(control);

    const ssize_t nbytes = ::recvmsg(pfd.fd, &msg, 0);
    if (nbytes < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      CASTPROXY_LOG_WARN("mDNS receive failed", {StringField("error", std::strerror(errno))});
      continue;
    }
    if (msg.msg_flags & MSG_TRUNC) {
      CASTPROXY_LOG_DEBUG("dropping truncated datagram", {IntField("limit", static_cast<int64_t>(buffer.size()))});
      continue;
    }

    unsigned int arrival_index = 0;
    for (cmsghdr* c = CMSG_FIRSTHDR(&msg); c != nullptr; c = CMSG_NXTHDR(&msg, c)) {
      if (c->cmsg_level == IPPROTO_IP && c->cmsg_type == IP_PKTINFO) {
        in_pktinfo info{};
        std::memcpy(&info, CMSG_DATA(c), sizeof(info));
        arrival_index = static_cast<unsigned int>(info.ipi_ifindex);
      }
    }

    char address[INET_ADDRSTRLEN]{};
    inet_ntop(AF_INET, &source.sin_addr, address, sizeof(address));

    if (arrival_index != interface_index_) {
      CASTPROXY_LOG_DEBUG("ignoring datagram from another interface",
                          {StringField("source", address), IntField("ifindex", arrival_index)});
      continue;
    }

    Datagram datagram;
    datagram.payload.assign(buffer.begin(), buffer.begin() + nbytes);
    datagram.source.address = address;
    datagram.source.port    = ntohs(source.sin_port);

    try {
      handler_(std::move(datagram));
    } catch (const std::exception& e) {
      CASTPROXY_LOG_ERROR("datagram handler failed", {StringField("source", address), StringField("error", e.what())});
    }
  }
}

util::Result MulticastListener::SendTo(const Endpoint& destination, const std::vector<uint8_t>& payload) {
  const int fd = sockfd_.load();
  if (fd < 0) {
    return util::Result::Err(util::ErrorCode::IOError, "socket not open");
  }

  sockaddr_in to{};
  to.sin_family = AF_INET;
  to.sin_port   = htons(destination.port);
  if (inet_pton(AF_INET, destination.address.c_str(), &to.sin_addr) != 1) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, "not an IPv4 address: " + destination.address);
  }
  if (IN_MULTICAST(ntohl(to.sin_addr.s_addr))) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, "refusing to send to multicast destination " + destination.address);
  }

  const ssize_t sent = ::sendto(fd, payload.data(), payload.size(), 0, reinterpret_cast<const sockaddr*>(&to), sizeof(to));
  if (sent < 0) {
    return util::Result::Err(util::ErrorCode::IOError, std::strerror(errno));
  }
  if (static_cast<size_t>(sent) != payload.size()) {
    return util::Result::Err(util::ErrorCode::IOError, "short send");
  }
  return util::Result::Ok();
}

} // namespace castproxy::net
