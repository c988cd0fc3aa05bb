#pragma once

#include <atomic>
#include <cstdint>

#include "internal/factory.hpp"

namespace castproxy::runtime {

/*
  Wires the listener to the worker pool and owns the start/stop order:
  workers first so the first datagram has somewhere to go, listener
  last; the reverse on shutdown.
*/
class Server {
 public:
  explicit Server(factory::Application app);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  uint64_t Dropped() const {
    return dropped_.load();
  }

 private:
  void Dispatch(net::Datagram datagram);

  factory::Application  app_;
  std::atomic<bool>     started_{false};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace castproxy::runtime
