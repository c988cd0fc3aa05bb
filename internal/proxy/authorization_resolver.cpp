#include "authorization_resolver.hpp"

#include "internal/observability/logging.hpp"

namespace castproxy::proxy {

using castproxy::observability::StringField;

AuthorizationResolver::AuthorizationResolver(std::shared_ptr<store::PairingStore> pairings, std::chrono::milliseconds read_timeout, size_t max_outstanding)
    : pairings_(std::move(pairings)), reads_("pairing store", read_timeout, max_outstanding) {
}

std::optional<Authorization> AuthorizationResolver::Resolve(const std::string& guest_address, util::TimePoint now) const {
  std::optional<model::PairingRecord> record;
  try {
    auto store = pairings_;
    record     = reads_.Call([store, guest_address] { return store->Lookup(guest_address); });
  } catch (const std::exception& e) {
    CASTPROXY_LOG_WARN("pairing store unreadable, denying", {StringField("guest", guest_address), StringField("error", e.what())});
    return std::nullopt;
  }

  if (!record) {
    CASTPROXY_LOG_INFO("guest not paired", {StringField("guest", guest_address)});
    return std::nullopt;
  }
  if (!record->IsActiveAt(now)) {
    CASTPROXY_LOG_INFO("pairing expired", {StringField("guest", guest_address), StringField("room", record->room)});
    return std::nullopt;
  }
  if (record->room.empty()) {
    CASTPROXY_LOG_WARN("pairing has no room, denying", {StringField("guest", guest_address)});
    return std::nullopt;
  }

  return Authorization{record->room, record->expires_at};
}

} // namespace castproxy::proxy
