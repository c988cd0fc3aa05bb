#include "memory_pairing_store.hpp"

namespace castproxy::store::memory {

std::optional<model::PairingRecord> MemoryPairingStore::Lookup(const std::string& guest_address) {
  std::lock_guard lock(mutex_);
  auto            it = pairings_.find(guest_address);
  if (it == pairings_.end()) return std::nullopt;
  return it->second;
}

void MemoryPairingStore::Put(const model::PairingRecord& record) {
  std::lock_guard lock(mutex_);
  pairings_[record.guest_address] = record;
}

void MemoryPairingStore::Remove(const std::string& guest_address) {
  std::lock_guard lock(mutex_);
  pairings_.erase(guest_address);
}

} // namespace castproxy::store::memory
