#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/util/result.hpp"

namespace castproxy::firewall {

class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  // argv[0] is resolved through PATH. No shell is involved.
  virtual util::Result Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) = 0;
};

/*
  fork/execvp runner. stdout is discarded; the first part of stderr is
  kept for the error message. A child still running at the deadline is
  killed and reaped.
*/
class ProcessRunner final : public CommandRunner {
 public:
  util::Result Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
};

} // namespace castproxy::firewall
