#pragma once

#include <optional>
#include <string>

#include "internal/model/pairing_record.hpp"

namespace castproxy::store {

/*
  Read-only view of guest -> room pairings.

  The proxy never caches what it reads here: every call reflects the
  backing store as of that call. Implementations throw
  util::StoreUnavailable when the store cannot be read; a missing entry
  is std::nullopt, not an error.
*/
class PairingStore {
 public:
  virtual ~PairingStore() = default;

  // Exact literal match on the guest address. Expiry is NOT evaluated here.
  virtual std::optional<model::PairingRecord> Lookup(const std::string& guest_address) = 0;
};

} // namespace castproxy::store
