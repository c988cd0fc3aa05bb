#include "internal/proxy/query_filter.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using castproxy::mdns::kGoogleCastService;
using castproxy::mdns::kTypeA;
using castproxy::mdns::kTypeANY;
using castproxy::mdns::kTypePTR;
using castproxy::mdns::kTypeSRV;
using castproxy::mdns::Question;
using castproxy::proxy::QueryFilter;
using castproxy::testing::QueryPacket;

void TestMatchesPtrQuestionForService() {
  QueryFilter filter(kGoogleCastService);
  auto        match = filter.Classify(castproxy::testing::CastQuery(7));
  assert(match.has_value());
  assert(match->id == 7);
  assert(match->question.type == kTypePTR);
}

void TestNameMatchIsCaseInsensitive() {
  QueryFilter filter(kGoogleCastService);
  assert(filter.Classify(QueryPacket({Question{"_GoogleCast._TCP.Local", kTypePTR, 1}})).has_value());
}

void TestOtherNamesAndTypesAreIrrelevant() {
  QueryFilter filter(kGoogleCastService);
  assert(!filter.Classify(QueryPacket({Question{"_airplay._tcp.local", kTypePTR, 1}})).has_value());
  assert(!filter.Classify(QueryPacket({Question{kGoogleCastService, kTypeSRV, 1}})).has_value());
  assert(!filter.Classify(QueryPacket({Question{kGoogleCastService, kTypeANY, 1}})).has_value());
  assert(!filter.Classify(QueryPacket({Question{"_googlecast._tcp.local.example", kTypePTR, 1}})).has_value());
  assert(!filter.Classify(QueryPacket({})).has_value());
}

void TestAnyMatchingQuestionInMultiQuestionPacket() {
  QueryFilter filter(kGoogleCastService);
  auto        match = filter.Classify(QueryPacket({
      Question{"printer.local", kTypeA, 1},
      Question{"_airplay._tcp.local", kTypePTR, 1},
      Question{kGoogleCastService, kTypePTR, 0x8001},
  }));
  assert(match.has_value());
  assert(match->question.name == kGoogleCastService);
  assert(match->question.UnicastResponseRequested());
}

void TestLabelsMatchExactly() {
  QueryFilter filter(kGoogleCastService);

  // two labels, the first holding a literal dot
  std::vector<uint8_t> packet = {0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0};
  const std::string    dotted = "_googlecast._tcp";
  packet.push_back(static_cast<uint8_t>(dotted.size()));
  packet.insert(packet.end(), dotted.begin(), dotted.end());
  const std::vector<uint8_t> rest = {5, 'l', 'o', 'c', 'a', 'l', 0, 0x00, 0x0C, 0x00, 0x01};
  packet.insert(packet.end(), rest.begin(), rest.end());
  assert(!filter.Classify(packet).has_value());

  assert(!filter.Classify(QueryPacket({Question{"_googlecast\\._tcp.local", kTypePTR, 1}})).has_value());
}

void TestResponsesAndNonStandardOpcodesAreIgnored() {
  QueryFilter filter(kGoogleCastService);
  const Question q{kGoogleCastService, kTypePTR, 1};
  assert(!filter.Classify(QueryPacket({q}, 0, castproxy::mdns::kFlagResponse)).has_value());
  assert(!filter.Classify(QueryPacket({q}, 0, 0x2000)).has_value());  // opcode 4 (notify)
}

void TestMalformedPayloadThrows() {
  QueryFilter filter(kGoogleCastService);
  bool        threw = false;
  try {
    (void)filter.Classify({0x00, 0x00, 0x00});
  } catch (const castproxy::util::MalformedPacket&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMatchesPtrQuestionForService();
  TestNameMatchIsCaseInsensitive();
  TestOtherNamesAndTypesAreIrrelevant();
  TestAnyMatchingQuestionInMultiQuestionPacket();
  TestLabelsMatchExactly();
  TestResponsesAndNonStandardOpcodesAreIgnored();
  TestMalformedPayloadThrows();

  std::cout << "cast_proxy_unit_query_filter: pass\n";
  return 0;
}
