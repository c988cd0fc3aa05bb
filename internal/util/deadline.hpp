#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

#include "internal/util/errors.hpp"

namespace castproxy::util {

/*
  Runs store reads with an upper bound on how long the caller waits and
  on how many reads may be outstanding at once.

  Each read executes on a detached helper thread; if it has not finished
  when the deadline passes, StoreUnavailable is thrown and the late
  result is discarded. A read that never returns keeps its slot, so a
  hung backend costs at most max_outstanding threads: once every slot is
  taken, Call fails with StoreUnavailable without starting another one.

  The callable must own (by value or shared_ptr) everything it touches,
  since it may outlive the caller. A zero timeout runs the callable
  inline with no bound.
*/
class DeadlineCaller {
 public:
  DeadlineCaller(std::string what, std::chrono::milliseconds timeout, size_t max_outstanding)
      : what_(std::move(what)), timeout_(timeout), max_outstanding_(max_outstanding == 0 ? 1 : max_outstanding) {
  }

  template <typename Fn>
  std::invoke_result_t<Fn> Call(Fn fn) const {
    using R = std::invoke_result_t<Fn>;

    if (timeout_.count() <= 0) {
      return fn();
    }

    if (outstanding_->fetch_add(1) >= max_outstanding_) {
      outstanding_->fetch_sub(1);
      throw StoreUnavailable(what_ + ": " + std::to_string(max_outstanding_) + " reads still outstanding");
    }

    auto task   = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto future = task->get_future();
    try {
      std::thread([task, slots = outstanding_] {
        (*task)();
        slots->fetch_sub(1);
      }).detach();
    } catch (const std::system_error& e) {
      outstanding_->fetch_sub(1);
      throw StoreUnavailable(what_ + ": cannot start read: " + e.what());
    }

    if (future.wait_for(timeout_) != std::future_status::ready) {
      throw StoreUnavailable(what_ + ": read deadline of " + std::to_string(timeout_.count()) + "ms exceeded");
    }
    return future.get();
  }

  // Reads started and not yet returned, including ones past their deadline.
  size_t Outstanding() const {
    return outstanding_->load();
  }

 private:
  std::string               what_;
  std::chrono::milliseconds timeout_;
  size_t                    max_outstanding_;

  // Shared with the helper threads, which may finish after this object is gone.
  std::shared_ptr<std::atomic<size_t>> outstanding_ = std::make_shared<std::atomic<size_t>>(0);
};

} // namespace castproxy::util
