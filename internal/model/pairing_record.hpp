#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace castproxy::model {

/*
  Binds one guest address to one room for a bounded time.

  IMPORTANT:
  - guest_address is the literal IPv4 string of the guest; lookups are
    exact string matches, never prefix or subnet matches.
  - Authorization holds only while now < expires_at. Expired records are
    not evicted; they simply stop authorizing.
*/
struct PairingRecord {
  std::string guest_address;
  std::string room;

  util::TimePoint paired_at{};
  util::TimePoint expires_at{};

  // audit only
  std::string token_used;

  bool IsActiveAt(util::TimePoint now) const {
    return now < expires_at;
  }
};

} // namespace castproxy::model
