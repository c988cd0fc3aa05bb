#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/mdns/mdns_constants.hpp"

namespace castproxy::mdns {

/*
  In-memory form of a DNS / mDNS message (RFC 1035, RFC 6762).

  Names are held in dotted form without a trailing dot; a '.' or '\\'
  that is part of a label is escaped with a backslash. Only the record
  types the proxy reads or writes get typed rdata; everything else is
  kept as raw bytes so a packet with unfamiliar records still decodes.
*/

struct Question {
  std::string name;
  uint16_t    type  = kTypePTR;
  uint16_t    klass = kClassIN;

  bool UnicastResponseRequested() const {
    return (klass & kClassTopBit) != 0;
  }
};

struct AData {
  std::array<uint8_t, 4> address{};
};

struct PtrData {
  std::string target;
};

// Each entry is one character-string, typically "key=value".
struct TxtData {
  std::vector<std::string> entries;
};

struct SrvData {
  uint16_t    priority = 0;
  uint16_t    weight   = 0;
  uint16_t    port     = 0;
  std::string target;
};

struct RawData {
  std::vector<uint8_t> bytes;
};

using RecordData = std::variant<RawData, AData, PtrData, TxtData, SrvData>;

struct ResourceRecord {
  std::string name;
  uint16_t    type  = 0;
  uint16_t    klass = kClassIN;
  uint32_t    ttl   = 0;
  RecordData  data;
};

struct Message {
  uint16_t id    = 0;
  uint16_t flags = 0;

  std::vector<Question>       questions;
  std::vector<ResourceRecord> answers;
  std::vector<ResourceRecord> authorities;
  std::vector<ResourceRecord> additionals;

  bool IsResponse() const {
    return (flags & kFlagResponse) != 0;
  }
};

// Throws util::MalformedPacket on any structural violation.
Message Decode(const uint8_t* data, size_t len);
Message Decode(const std::vector<uint8_t>& bytes);

// Throws std::invalid_argument for names that cannot be encoded.
std::vector<uint8_t> Encode(const Message& message);

// ------------------------------------------------------------------
// Record construction
// ------------------------------------------------------------------

ResourceRecord MakePtr(const std::string& name, uint32_t ttl, const std::string& target);
ResourceRecord MakeTxt(const std::string& name, uint32_t ttl, std::vector<std::string> entries);
ResourceRecord MakeSrv(const std::string& name, uint32_t ttl, uint16_t port, const std::string& target);
ResourceRecord MakeA(const std::string& name, uint32_t ttl, const std::array<uint8_t, 4>& address);

// ------------------------------------------------------------------
// Names and addresses
// ------------------------------------------------------------------

// Lowercased, trailing dot(s) removed.
std::string CanonicalName(const std::string& name);

// Case-insensitive label comparison, ignoring a trailing dot.
bool NamesEqual(const std::string& a, const std::string& b);

std::optional<std::array<uint8_t, 4>> ParseIPv4(const std::string& address);
std::string                           FormatIPv4(const std::array<uint8_t, 4>& address);

} // namespace castproxy::mdns
