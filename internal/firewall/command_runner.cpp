#include "command_runner.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace castproxy::firewall {

namespace {

constexpr size_t kMaxCapturedStderr = 512;

std::string DrainStderr(int fd) {
  std::string captured;
  char        buf[256];
  while (captured.size() < kMaxCapturedStderr) {
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n <= 0) break;
    captured.append(buf, static_cast<size_t>(n));
  }
  while (!captured.empty() && (captured.back() == '\n' || captured.back() == '\r')) {
    captured.pop_back();
  }
  return captured;
}

std::string Describe(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) out.push_back(' ');
    out += arg;
  }
  return out;
}

} // namespace

util::Result ProcessRunner::Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, "empty command");
  }

  // everything the child touches is prepared before fork
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  int err_pipe[2];
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    return util::Result::Err(util::ErrorCode::ExecFailed, std::string("pipe: ") + std::strerror(errno));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const std::string msg = std::strerror(errno);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return util::Result::Err(util::ErrorCode::ExecFailed, "fork: " + msg);
  }

  if (pid == 0) {
    const int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
    }
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(args[0], args.data());
    _exit(127);
  }

  close(err_pipe[1]);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto  deadline = std::chrono::steady_clock::now() + timeout;
  int         status   = 0;
  bool        exited   = false;
  bool        failed   = false;
  std::string wait_error;

  while (true) {
    const pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      exited = true;
      break;
    }
    if (r < 0 && errno != EINTR) {
      failed     = true;
      wait_error = std::strerror(errno);
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  if (!exited && !failed) {
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close(err_pipe[0]);
    return util::Result::Err(util::ErrorCode::Timeout, Describe(argv) + ": timed out after " + std::to_string(timeout.count()) + "ms");
  }

  const std::string stderr_text = DrainStderr(err_pipe[0]);
  close(err_pipe[0]);

  if (failed) {
    return util::Result::Err(util::ErrorCode::ExecFailed, Describe(argv) + ": waitpid: " + wait_error);
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    return util::Result::Ok();
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
    return util::Result::Err(util::ErrorCode::ExecFailed, Describe(argv) + ": command not found");
  }

  std::string msg = Describe(argv);
  if (WIFEXITED(status)) {
    msg += ": exit status " + std::to_string(WEXITSTATUS(status));
  } else if (WIFSIGNALED(status)) {
    msg += ": killed by signal " + std::to_string(WTERMSIG(status));
  }
  if (!stderr_text.empty()) {
    msg += ": " + stderr_text;
  }
  return util::Result::Err(util::ErrorCode::ExecFailed, msg);
}

} // namespace castproxy::firewall
