#pragma once

#include <string>
#include <utility>

namespace castproxy::util {

/*
  Portable result codes for actions whose failure is logged rather than
  thrown (datagram sends, firewall rule installs, child processes).
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  InvalidArgument,
  Timeout,

  IOError,
  ExecFailed,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace castproxy::util
