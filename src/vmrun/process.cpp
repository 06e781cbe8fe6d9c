#include <vmrun/process.h>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <vmrun/errors.h>
#include "utils.h"

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr auto kKillGrace = std::chrono::seconds(2);

bool IsExecutable(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

// retry on EINTR; WNOHANG returns 0 while the child is running
pid_t WaitPid(pid_t pid, int* status, int options) {
  pid_t ret;
  do {
    ret = waitpid(pid, status, options);
  } while (ret < 0 && errno == EINTR);
  return ret;
}

// true if the child exited before the deadline
bool WaitUntil(pid_t pid, int* status, std::chrono::steady_clock::time_point deadline) {
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t ret = WaitPid(pid, status, WNOHANG);
    if (ret == pid) return true;
    // the pid may be gone; never signal it
    if (ret < 0) throw LaunchError(fmt::format("waitpid failed: {}", strerror(errno)));
    std::this_thread::sleep_for(kPollInterval);
  }
  return false;
}

ExecResult FromWaitStatus(int status) {
  ExecResult ret;
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.signal = WTERMSIG(status);
  }
  return ret;
}

} // namespace

std::string SerialChannel::Backend() const {
  switch (mode) {
    case ChannelMode::INTERACTIVE: return "mon:stdio";
    case ChannelMode::CAPTURE: return "file:" + sink.string();
  }
  __builtin_unreachable();
}

std::vector<std::string> ProcessSpec::Argv() const {
  std::vector<std::string> ret = {binary.string()};
  ret.insert(ret.end(), args.begin(), args.end());
  for (auto& i : channels) ret.insert(ret.end(), {"-serial", i.Backend()});
  return ret;
}

std::optional<fs::path> ProcessExecutor::Resolve(const std::string& binary) const {
  if (binary.empty()) return std::nullopt;
  if (binary.find('/') != std::string::npos) {
    if (IsExecutable(binary)) return fs::path(binary);
    return std::nullopt;
  }
  const char* path_env = getenv("PATH");
  std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= search.size()) {
    size_t end = search.find(':', start);
    if (end == std::string::npos) end = search.size();
    // an empty PATH entry means the current directory
    fs::path dir = end == start ? fs::path(".") : fs::path(search.substr(start, end - start));
    fs::path candidate = dir / binary;
    if (IsExecutable(candidate)) return candidate;
    start = end + 1;
  }
  return std::nullopt;
}

ExecResult ForkExecExecutor::Execute(const ProcessSpec& spec) {
  std::vector<std::string> argv = spec.Argv();
  std::vector<char*> argv_buf;
  for (auto& i : argv) argv_buf.push_back(i.data());
  argv_buf.push_back(nullptr);

  // reports the errno of a failed execv; closed on a successful one
  int errpipe[2];
  if (pipe2(errpipe, O_CLOEXEC) < 0) {
    throw LaunchError(fmt::format("pipe failed: {}", strerror(errno)));
  }
  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close(errpipe[0]);
    close(errpipe[1]);
    throw LaunchError(fmt::format("fork failed: {}", strerror(err)));
  }
  if (pid == 0) {
    close(errpipe[0]);
    execv(spec.binary.c_str(), argv_buf.data());
    int err = errno;
    IGNORE_RETURN(write(errpipe[1], &err, sizeof(err)));
    _exit(127);
  }
  close(errpipe[1]);
  spdlog::debug("exec pid={} childpid={} command={}", getpid(), pid, fmt::format("{}", argv));

  int exec_errno = 0;
  ssize_t nread;
  do {
    nread = read(errpipe[0], &exec_errno, sizeof(exec_errno));
  } while (nread < 0 && errno == EINTR);
  close(errpipe[0]);
  if (nread == sizeof(exec_errno)) {
    WaitPid(pid, nullptr, 0);
    throw LaunchError(fmt::format("cannot execute {}: {}", spec.binary.c_str(), strerror(exec_errno)));
  }

  int status = 0;
  if (spec.timeout <= 0) {
    if (WaitPid(pid, &status, 0) < 0) {
      throw LaunchError(fmt::format("waitpid failed: {}", strerror(errno)));
    }
    return FromWaitStatus(status);
  }

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(spec.timeout);
  if (WaitUntil(pid, &status, deadline)) return FromWaitStatus(status);

  spdlog::warn("Hypervisor pid={} still running after {}s, terminating", pid, spec.timeout);
  kill(pid, SIGTERM);
  if (!WaitUntil(pid, &status, std::chrono::steady_clock::now() + kKillGrace)) {
    spdlog::warn("Hypervisor pid={} ignored SIGTERM, killing", pid);
    kill(pid, SIGKILL);
    if (WaitPid(pid, &status, 0) < 0) {
      throw LaunchError(fmt::format("waitpid failed: {}", strerror(errno)));
    }
  }
  ExecResult ret = FromWaitStatus(status);
  ret.timed_out = true;
  return ret;
}
