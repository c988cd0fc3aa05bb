#include "response_builder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace castproxy::proxy {

namespace {

constexpr uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime  = 0x100000001b3ULL;

uint64_t Fnv1a64(const std::string& text, uint64_t seed) {
  uint64_t hash = seed;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

// 32 hex digits from two independent FNV-1a passes.
std::string HashedIdentity(const std::string& uuid) {
  const uint64_t hi = Fnv1a64(uuid, kFnvOffset);
  const uint64_t lo = Fnv1a64(uuid, hi ^ kFnvOffset);
  char           buf[33];
  std::snprintf(buf, sizeof(buf), "%016llx%016llx", static_cast<unsigned long long>(hi), static_cast<unsigned long long>(lo));
  return buf;
}

} // namespace

ResponseBuilder::ResponseBuilder(ResponseOptions options) : options_(std::move(options)) {
}

// The uuid is used verbatim only when that is already injective under
// case-insensitive DNS comparison; anything else is hashed so that e.g.
// "AB-c", "a-bc" and "abc" stay distinct.
std::string ResponseBuilder::InstanceLabel(const std::string& uuid) const {
  bool plain = !uuid.empty();
  for (unsigned char c : uuid) {
    if (!std::isdigit(c) && !std::islower(c)) {
      plain = false;
      break;
    }
  }

  std::string label = options_.instance_prefix + "-" + (plain ? uuid : HashedIdentity(uuid));
  if (label.size() > mdns::kMaxLabelLength) {
    label = options_.instance_prefix + "-" + HashedIdentity(uuid);
  }
  if (label.size() > mdns::kMaxLabelLength) {
    label.resize(mdns::kMaxLabelLength);
  }
  return label;
}

std::string ResponseBuilder::InstanceName(const std::string& uuid) const {
  return InstanceLabel(uuid) + "." + options_.service_name;
}

std::optional<mdns::Message> ResponseBuilder::Build(const model::DeviceRecord& device, const ReplyContext& reply) const {
  const auto address = mdns::ParseIPv4(device.ip);
  if (!address) return std::nullopt;

  const uint32_t ttl = reply.ttl_cap ? std::min(options_.record_ttl, *reply.ttl_cap) : options_.record_ttl;

  const std::string label    = InstanceLabel(device.uuid);
  const std::string instance = label + "." + options_.service_name;
  const std::string host     = label + ".local";

  mdns::Message message;
  message.id    = reply.id;
  message.flags = mdns::kFlagResponse | mdns::kFlagAuthoritative;
  if (reply.echoed_question) {
    mdns::Question question = *reply.echoed_question;
    question.klass &= mdns::kClassMask;
    message.questions.push_back(std::move(question));
  }

  message.answers.push_back(mdns::MakePtr(options_.service_name, ttl, instance));

  message.additionals.push_back(mdns::MakeTxt(instance, ttl,
                                              {"id=" + device.uuid, "fn=" + device.friendly_name, "md=" + options_.model_name,
                                               "ve=" + options_.txt_version, "ic=" + options_.icon_path}));
  message.additionals.push_back(mdns::MakeSrv(instance, ttl, options_.control_port, host));
  message.additionals.push_back(mdns::MakeA(host, ttl, *address));

  return message;
}

} // namespace castproxy::proxy
