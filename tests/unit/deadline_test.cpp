#include "internal/util/deadline.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using namespace std::chrono_literals;
using castproxy::util::DeadlineCaller;
using castproxy::util::StoreUnavailable;

void TestFastCallReturnsValue() {
  DeadlineCaller reads("fast", 1s, 2);
  assert(reads.Call([] { return 42; }) == 42);
  assert(reads.Outstanding() <= 1);
}

void TestSlowCallTimesOut() {
  DeadlineCaller reads("slow", 20ms, 2);
  auto           finished = std::make_shared<std::atomic<bool>>(false);

  bool threw = false;
  try {
    (void)reads.Call([finished] {
      std::this_thread::sleep_for(200ms);
      *finished = true;
      return 1;
    });
  } catch (const StoreUnavailable& e) {
    threw = std::string(e.what()).find("slow") != std::string::npos;
  }
  assert(threw);
  assert(reads.Outstanding() == 1);

  // the late call still runs to completion on its own thread and frees its slot
  std::this_thread::sleep_for(400ms);
  assert(finished->load());
  assert(reads.Outstanding() == 0);
}

void TestOutstandingLimitFailsFast() {
  DeadlineCaller reads("stuck", 10ms, 2);
  auto           release = std::make_shared<std::atomic<bool>>(false);
  auto           started = std::make_shared<std::atomic<int>>(0);

  auto stuck = [release, started] {
    ++*started;
    while (!release->load()) {
      std::this_thread::sleep_for(5ms);
    }
    return 0;
  };

  for (int i = 0; i < 10; ++i) {
    bool threw = false;
    try {
      (void)reads.Call(stuck);
    } catch (const StoreUnavailable&) {
      threw = true;
    }
    assert(threw);
  }
  assert(reads.Outstanding() == 2);

  std::this_thread::sleep_for(50ms);
  assert(started->load() == 2);

  *release = true;
  for (int i = 0; i < 100 && reads.Outstanding() > 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  assert(reads.Outstanding() == 0);
  assert(reads.Call([] { return 7; }) == 7);
}

void TestExceptionsPropagate() {
  DeadlineCaller reads("failing", 1s, 2);

  bool threw = false;
  try {
    (void)reads.Call([]() -> int { throw StoreUnavailable("backend down"); });
  } catch (const StoreUnavailable& e) {
    threw = std::string(e.what()) == "backend down";
  }
  assert(threw);

  for (int i = 0; i < 100 && reads.Outstanding() > 0; ++i) {
    std::this_thread::sleep_for(5ms);
  }
  assert(reads.Outstanding() == 0);
}

void TestZeroTimeoutRunsInline() {
  DeadlineCaller reads("inline", 0ms, 1);
  const auto     caller = std::this_thread::get_id();
  assert(reads.Call([caller] { return std::this_thread::get_id() == caller; }));
}

} // namespace

int main() {
  TestFastCallReturnsValue();
  TestSlowCallTimesOut();
  TestOutstandingLimitFailsFast();
  TestExceptionsPropagate();
  TestZeroTimeoutRunsInline();

  std::cout << "cast_proxy_unit_deadline: pass\n";
  return 0;
}
