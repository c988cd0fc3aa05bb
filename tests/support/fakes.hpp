#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/firewall/command_runner.hpp"
#include "internal/firewall/firewall.hpp"
#include "internal/mdns/dns_message.hpp"
#include "internal/net/datagram.hpp"
#include "internal/store/api/device_registry.hpp"
#include "internal/store/api/pairing_store.hpp"
#include "internal/util/errors.hpp"

namespace castproxy::testing {

struct SentPacket {
  net::Endpoint        destination;
  std::vector<uint8_t> payload;
};

class RecordingSender final : public net::DatagramSender {
 public:
  util::Result SendTo(const net::Endpoint& destination, const std::vector<uint8_t>& payload) override {
    std::lock_guard lock(mutex_);
    if (fail) return util::Result::Err(util::ErrorCode::IOError, "send refused");
    sent_.push_back({destination, payload});
    return util::Result::Ok();
  }

  std::vector<SentPacket> Sent() {
    std::lock_guard lock(mutex_);
    return sent_;
  }

  bool fail = false;

 private:
  std::mutex              mutex_;
  std::vector<SentPacket> sent_;
};

struct AllowCall {
  std::string          guest;
  std::string          device;
  std::chrono::seconds ttl{0};
};

class RecordingFirewall final : public firewall::Firewall {
 public:
  util::Result Allow(const std::string& guest, const std::string& device, std::chrono::seconds ttl) override {
    std::lock_guard lock(mutex_);
    calls_.push_back({guest, device, ttl});
    if (fail) return util::Result::Err(util::ErrorCode::ExecFailed, "rule install refused");
    return util::Result::Ok();
  }

  std::string Name() const override {
    return "recording";
  }

  std::vector<AllowCall> Calls() {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  bool fail = false;

 private:
  std::mutex             mutex_;
  std::vector<AllowCall> calls_;
};

class FakeRunner final : public firewall::CommandRunner {
 public:
  util::Result Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override {
    invocations.push_back(argv);
    last_timeout = timeout;
    return next;
  }

  std::vector<std::vector<std::string>> invocations;
  std::chrono::milliseconds             last_timeout{0};
  util::Result                          next = util::Result::Ok();
};

// Pairing store that cannot be read.
class BrokenPairingStore final : public store::PairingStore {
 public:
  std::optional<model::PairingRecord> Lookup(const std::string&) override {
    throw util::StoreUnavailable("pairing store offline");
  }
};

class BrokenDeviceRegistry final : public store::DeviceRegistry {
 public:
  std::vector<model::DeviceRecord> ListByRoom(const std::string&) override {
    throw util::StoreUnavailable("device registry offline");
  }

  void Upsert(const model::DeviceRecord&) override {
    throw util::StoreUnavailable("device registry offline");
  }
};

inline std::vector<uint8_t> QueryPacket(const std::vector<mdns::Question>& questions, uint16_t id = 0, uint16_t flags = 0) {
  mdns::Message query;
  query.id        = id;
  query.flags     = flags;
  query.questions = questions;
  return mdns::Encode(query);
}

inline std::vector<uint8_t> CastQuery(uint16_t id = 0) {
  return QueryPacket({mdns::Question{mdns::kGoogleCastService, mdns::kTypePTR, mdns::kClassIN}}, id);
}

} // namespace castproxy::testing
