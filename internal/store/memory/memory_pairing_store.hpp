#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/store/api/pairing_store.hpp"

namespace castproxy::store::memory {

class MemoryPairingStore final : public store::PairingStore {
 public:
  std::optional<model::PairingRecord> Lookup(const std::string& guest_address) override;

  void Put(const model::PairingRecord& record);
  void Remove(const std::string& guest_address);

 private:
  std::mutex                                            mutex_;
  std::unordered_map<std::string, model::PairingRecord> pairings_;
};

} // namespace castproxy::store::memory
