#include "json_pairing_store.hpp"

#include "castproxy/store/store.pb.h"
#include "json_document.hpp"

namespace castproxy::store::file {

JsonPairingStore::JsonPairingStore(std::string path) : path_(std::move(path)) {
}

std::optional<model::PairingRecord> JsonPairingStore::Lookup(const std::string& guest_address) {
  castproxy::store::v1::PairingFile document;
  ParseWrapped(path_, "pairings", ReadDocument(path_), &document);

  const auto& pairings = document.pairings();
  auto        it       = pairings.find(guest_address);
  if (it == pairings.end()) return std::nullopt;

  const auto&          entry = it->second;
  model::PairingRecord record;
  record.guest_address = guest_address;
  record.room          = entry.room();
  record.paired_at     = util::FromProto(entry.paired_at());
  record.expires_at    = util::FromProto(entry.expires_at());
  record.token_used    = entry.token_used();
  return record;
}

} // namespace castproxy::store::file
