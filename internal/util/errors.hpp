#pragma once

#include <stdexcept>
#include <string>

namespace castproxy::util {

/*
  Central error types.

  The datagram pipeline catches these at its boundary and maps each one
  to a drop, an "unauthorized" or an "empty" outcome. Nothing thrown
  here is allowed to escape a worker.
*/

// Datagram could not be decoded as a DNS message.
class MalformedPacket : public std::runtime_error {
 public:
  explicit MalformedPacket(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Pairing store or device registry could not be read (missing, corrupt,
// backend error, or read deadline exceeded).
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace castproxy::util
