#include "query_filter.hpp"

namespace castproxy::proxy {

QueryFilter::QueryFilter(std::string service_name) : service_name_(std::move(service_name)) {
}

std::optional<MatchedQuery> QueryFilter::Classify(const std::vector<uint8_t>& payload) const {
  return Match(mdns::Decode(payload));
}

std::optional<MatchedQuery> QueryFilter::Match(const mdns::Message& message) const {
  if (message.IsResponse()) return std::nullopt;
  // RFC 6762 section 18.3: non-zero opcodes are silently ignored
  if ((message.flags & mdns::kOpcodeMask) != 0) return std::nullopt;

  for (const auto& question : message.questions) {
    if (question.type != mdns::kTypePTR) continue;
    if (!mdns::NamesEqual(question.name, service_name_)) continue;
    return MatchedQuery{message.id, question};
  }
  return std::nullopt;
}

} // namespace castproxy::proxy
