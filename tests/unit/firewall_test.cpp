#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/firewall/command_runner.hpp"
#include "internal/firewall/ipset_firewall.hpp"
#include "internal/firewall/nftables_firewall.hpp"
#include "tests/support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using castproxy::firewall::IpsetFirewall;
using castproxy::firewall::IpsetOptions;
using castproxy::firewall::NftablesFirewall;
using castproxy::firewall::NftablesOptions;
using castproxy::firewall::ProcessRunner;
using castproxy::testing::FakeRunner;
using castproxy::util::ErrorCode;

void TestNftablesCommandLine() {
  auto             runner = std::make_shared<FakeRunner>();
  NftablesFirewall firewall(NftablesOptions{}, runner);

  auto result = firewall.Allow("10.0.20.5", "10.0.30.9", 12h);
  assert(result);
  assert(runner->invocations.size() == 1);

  const std::vector<std::string> expected = {"nft", "add", "element", "inet", "castproxy", "guest_device_allow", "{ 10.0.20.5 . 10.0.30.9 timeout 43200s }"};
  assert(runner->invocations[0] == expected);
  assert(runner->last_timeout == 5000ms);
}

void TestIpsetCommandLine() {
  auto runner = std::make_shared<FakeRunner>();

  IpsetOptions options;
  options.set             = "guests";
  options.command_timeout = 750ms;
  IpsetFirewall firewall(options, runner);

  assert(firewall.Allow("10.0.20.5", "10.0.30.9", 600s));
  const std::vector<std::string> expected = {"ipset", "-exist", "add", "guests", "10.0.20.5,10.0.30.9", "timeout", "600"};
  assert(runner->invocations[0] == expected);
  assert(runner->last_timeout == 750ms);
}

void TestRepeatedAllowIsIdempotent() {
  auto             runner = std::make_shared<FakeRunner>();
  NftablesFirewall firewall(NftablesOptions{}, runner);

  assert(firewall.Allow("10.0.20.5", "10.0.30.9", 60s));
  assert(firewall.Allow("10.0.20.5", "10.0.30.9", 60s));
  assert(runner->invocations.size() == 2);
  assert(runner->invocations[0] == runner->invocations[1]);
}

void TestRefusesArgumentsThatAreNotAddresses() {
  auto             runner = std::make_shared<FakeRunner>();
  NftablesFirewall nft(NftablesOptions{}, runner);
  IpsetFirewall    ipset(IpsetOptions{}, runner);

  assert(nft.Allow("10.0.20.5 } ; flush ruleset", "10.0.30.9", 60s).code == ErrorCode::InvalidArgument);
  assert(ipset.Allow("10.0.20.5", "10.0.30.0/24", 60s).code == ErrorCode::InvalidArgument);
  assert(nft.Allow("10.0.20.5", "10.0.30.9", 0s).code == ErrorCode::InvalidArgument);
  assert(runner->invocations.empty());
}

void TestRunnerFailureIsReported() {
  auto runner  = std::make_shared<FakeRunner>();
  runner->next = castproxy::util::Result::Err(ErrorCode::ExecFailed, "nft: No such file or directory");

  NftablesFirewall firewall(NftablesOptions{}, runner);
  auto             result = firewall.Allow("10.0.20.5", "10.0.30.9", 60s);
  assert(!result);
  assert(result.code == ErrorCode::ExecFailed);
}

void TestProcessRunnerExitStatuses() {
  ProcessRunner runner;

  assert(runner.Run({"true"}, 2s));

  auto failed = runner.Run({"sh", "-c", "echo 'set not found' >&2; exit 3"}, 2s);
  assert(failed.code == ErrorCode::ExecFailed);
  assert(failed.message.find("exit status 3") != std::string::npos);
  assert(failed.message.find("set not found") != std::string::npos);

  auto missing = runner.Run({"cast-proxy-no-such-binary"}, 2s);
  assert(missing.code == ErrorCode::ExecFailed);
  assert(missing.message.find("command not found") != std::string::npos);

  assert(runner.Run({}, 1s).code == ErrorCode::InvalidArgument);
}

void TestProcessRunnerKillsAtDeadline() {
  ProcessRunner runner;

  const auto start   = std::chrono::steady_clock::now();
  auto       result  = runner.Run({"sleep", "5"}, 100ms);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  assert(result.code == ErrorCode::Timeout);
  assert(elapsed < 3s);
}

} // namespace

int main() {
  TestNftablesCommandLine();
  TestIpsetCommandLine();
  TestRepeatedAllowIsIdempotent();
  TestRefusesArgumentsThatAreNotAddresses();
  TestRunnerFailureIsReported();
  TestProcessRunnerExitStatuses();
  TestProcessRunnerKillsAtDeadline();

  std::cout << "cast_proxy_unit_firewall: pass\n";
  return 0;
}
