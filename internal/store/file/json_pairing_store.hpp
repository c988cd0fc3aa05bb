#pragma once

#include <string>

#include "internal/store/api/pairing_store.hpp"

namespace castproxy::store::file {

/*
  Pairing store over the pairing API's pairings.json:

    { "10.0.20.5": { "room": "101", "paired_at": "...Z",
                     "expires_at": "...Z", "token_used": "..." } }

  The file is re-read on every lookup.
*/
class JsonPairingStore final : public store::PairingStore {
 public:
  explicit JsonPairingStore(std::string path);

  std::optional<model::PairingRecord> Lookup(const std::string& guest_address) override;

 private:
  std::string path_;
};

} // namespace castproxy::store::file
