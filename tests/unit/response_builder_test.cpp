#include "internal/proxy/response_builder.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "internal/mdns/dns_message.hpp"

namespace {

using castproxy::mdns::AData;
using castproxy::mdns::PtrData;
using castproxy::mdns::SrvData;
using castproxy::mdns::TxtData;
using castproxy::model::DeviceRecord;
using castproxy::proxy::ReplyContext;
using castproxy::proxy::ResponseBuilder;
using castproxy::proxy::ResponseOptions;

DeviceRecord Device(const std::string& uuid, const std::string& name, const std::string& ip) {
  DeviceRecord device;
  device.uuid          = uuid;
  device.friendly_name = name;
  device.ip            = ip;
  device.room          = "101";
  return device;
}

void TestRecordSetForOneDevice() {
  ResponseBuilder builder{ResponseOptions{}};
  const auto      device = Device("abc", "Lobby TV", "10.0.30.9");

  auto message = builder.Build(device, ReplyContext{});
  assert(message.has_value());
  assert(message->id == 0);
  assert(message->flags == 0x8400);
  assert(message->questions.empty());
  assert(message->answers.size() == 1);
  assert(message->additionals.size() == 3);

  const std::string instance = "Chromecast-abc._googlecast._tcp.local";

  const auto& ptr = message->answers[0];
  assert(ptr.type == castproxy::mdns::kTypePTR);
  assert(ptr.name == "_googlecast._tcp.local");
  assert(ptr.ttl == 120);
  assert(std::get<PtrData>(ptr.data).target == instance);

  const auto& txt = message->additionals[0];
  assert(txt.name == instance);
  const auto& entries = std::get<TxtData>(txt.data).entries;
  assert(entries.size() == 5);
  assert(entries[0] == "id=abc");
  assert(entries[1] == "fn=Lobby TV");
  assert(entries[2] == "md=Chromecast");
  assert(entries[3] == "ve=05");
  assert(entries[4] == "ic=/setup/icon.png");

  const auto& srv = message->additionals[1];
  assert(srv.name == instance);
  assert(std::get<SrvData>(srv.data).port == 8009);
  assert(std::get<SrvData>(srv.data).target == "Chromecast-abc.local");

  const auto& a = message->additionals[2];
  assert(a.name == "Chromecast-abc.local");
  assert(castproxy::mdns::FormatIPv4(std::get<AData>(a.data).address) == "10.0.30.9");

  for (const auto& rr : message->additionals) {
    assert(rr.ttl == 120);
  }
}

void TestInstanceLabelDependsOnUuidOnly() {
  ResponseBuilder builder{ResponseOptions{}};

  auto first  = Device("4f5e-AA01-77", "Lobby TV", "10.0.30.9");
  auto second = Device("4f5e-AA01-77", "Renamed", "10.0.30.44");
  second.room = "202";

  const auto a = builder.Build(first, ReplyContext{});
  const auto b = builder.Build(second, ReplyContext{});
  assert(std::get<PtrData>(a->answers[0].data).target == std::get<PtrData>(b->answers[0].data).target);
  assert(builder.InstanceLabel("4f5eaa0177") == "Chromecast-4f5eaa0177");
  assert(builder.InstanceLabel("abc") != builder.InstanceLabel("abd"));
}

void TestDistinctUuidsGetDistinctLabels() {
  ResponseBuilder builder{ResponseOptions{}};

  const std::vector<std::string> uuids = {"abc", "AB-c", "a-bc", "ABC", "ab-c", "4f5eaa0177", "4f5e-aa01-77", "4F5EAA0177"};
  std::set<std::string>          labels;
  for (const auto& uuid : uuids) {
    labels.insert(castproxy::mdns::CanonicalName(builder.InstanceLabel(uuid)));
  }
  assert(labels.size() == uuids.size());

  const std::string dashed = builder.InstanceLabel("4f5e-aa01-77");
  assert(dashed.size() == std::string("Chromecast-").size() + 32);
  assert(dashed == builder.InstanceLabel("4f5e-aa01-77"));
}

void TestUnusualUuidsStillYieldValidLabels() {
  ResponseBuilder builder{ResponseOptions{}};

  const std::string dotted = builder.InstanceLabel("weird.uuid/with spaces");
  assert(dotted.find('.') == std::string::npos);
  assert(dotted.size() <= castproxy::mdns::kMaxLabelLength);
  assert(dotted == builder.InstanceLabel("weird.uuid/with spaces"));
  assert(dotted != builder.InstanceLabel("weird.uuid/with spaces2"));

  const std::string long_uuid(80, 'f');
  assert(builder.InstanceLabel(long_uuid).size() <= castproxy::mdns::kMaxLabelLength);

  // the whole message must still encode
  auto message = builder.Build(Device("weird.uuid/with spaces", "x", "10.0.30.9"), ReplyContext{});
  (void)castproxy::mdns::Encode(*message);
}

void TestLegacyReplyEchoesQuestionAndCapsTtl() {
  ResponseBuilder builder{ResponseOptions{}};

  ReplyContext reply;
  reply.id              = 0x4242;
  reply.echoed_question = castproxy::mdns::Question{"_googlecast._tcp.local", castproxy::mdns::kTypePTR, 0x8001};
  reply.ttl_cap         = 10;

  auto message = builder.Build(Device("abc", "TV", "10.0.30.9"), reply);
  assert(message->id == 0x4242);
  assert(message->questions.size() == 1);
  assert(message->questions[0].klass == castproxy::mdns::kClassIN);
  assert(message->answers[0].ttl == 10);
  for (const auto& rr : message->additionals) {
    assert(rr.ttl == 10);
  }
}

void TestConfiguredAttributesFlowIntoRecords() {
  ResponseOptions options;
  options.record_ttl      = 60;
  options.control_port    = 8443;
  options.instance_prefix = "Cast";
  options.model_name      = "Chromecast Ultra";

  ResponseBuilder builder(options);
  auto            message = builder.Build(Device("abc", "TV", "10.0.30.9"), ReplyContext{});
  assert(std::get<PtrData>(message->answers[0].data).target == "Cast-abc._googlecast._tcp.local");
  assert(std::get<SrvData>(message->additionals[1].data).port == 8443);
  assert(std::get<TxtData>(message->additionals[0].data).entries[2] == "md=Chromecast Ultra");
  assert(message->answers[0].ttl == 60);
}

void TestInvalidDeviceAddressYieldsNothing() {
  ResponseBuilder builder{ResponseOptions{}};
  assert(!builder.Build(Device("abc", "TV", "not-an-ip"), ReplyContext{}).has_value());
  assert(!builder.Build(Device("abc", "TV", "fd00::9"), ReplyContext{}).has_value());
}

} // namespace

int main() {
  TestRecordSetForOneDevice();
  TestInstanceLabelDependsOnUuidOnly();
  TestDistinctUuidsGetDistinctLabels();
  TestUnusualUuidsStillYieldValidLabels();
  TestLegacyReplyEchoesQuestionAndCapsTtl();
  TestConfiguredAttributesFlowIntoRecords();
  TestInvalidDeviceAddressYieldsNothing();

  std::cout << "cast_proxy_unit_response_builder: pass\n";
  return 0;
}
