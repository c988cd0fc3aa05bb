#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "internal/store/api/pairing_store.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/time.hpp"

namespace castproxy::proxy {

struct Authorization {
  std::string     room;
  util::TimePoint expires_at{};
};

/*
  Maps a querier address to the room it may see. Fail-closed:

  - no record, expired record (expires_at <= now) or empty room: nullopt
  - store unreadable, corrupt or slower than read_timeout: nullopt
  - max_outstanding reads already stuck in the store: nullopt

  Every call performs a fresh store read.
*/
class AuthorizationResolver {
 public:
  AuthorizationResolver(std::shared_ptr<store::PairingStore> pairings, std::chrono::milliseconds read_timeout, size_t max_outstanding = 4);

  std::optional<Authorization> Resolve(const std::string& guest_address, util::TimePoint now) const;

 private:
  std::shared_ptr<store::PairingStore> pairings_;
  util::DeadlineCaller                 reads_;
};

} // namespace castproxy::proxy
