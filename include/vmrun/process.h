#ifndef INCLUDE_VMRUN_PROCESS_H_
#define INCLUDE_VMRUN_PROCESS_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

#define ENUM_CHANNEL_MODE_ \
  X(INTERACTIVE) /* multiplexed with the host stdio */ \
  X(CAPTURE) /* write-only, backed by a host file */
enum class ChannelMode {
#define X(name) name,
  ENUM_CHANNEL_MODE_
#undef X
};

struct SerialChannel {
  ChannelMode mode;
  fs::path sink; // empty for INTERACTIVE

  // QEMU chardev backend string
  std::string Backend() const;
};

// Everything needed to start the hypervisor. Serial channels are numbered by
//   their position (channel 0 = ttyS0 in the guest).
struct ProcessSpec {
  fs::path binary;
  std::vector<std::string> args; // without argv[0] and serial options
  std::vector<SerialChannel> channels;
  long timeout; // seconds, 0 = no limit

  ProcessSpec() : timeout(0) {}

  std::vector<std::string> Argv() const;
};

struct ExecResult {
  int exit_code; // -1 if signaled
  int signal; // 0 if exited normally
  bool timed_out; // killed by us after the timeout

  ExecResult() : exit_code(-1), signal(0), timed_out(false) {}
  bool Exited() const { return signal == 0 && exit_code >= 0; }
};

class ProcessExecutor {
 public:
  virtual ~ProcessExecutor() = default;
  // PATH search for bare names; empty if not found or not executable
  virtual std::optional<fs::path> Resolve(const std::string& binary) const;
  // Blocks until the child exits (or the timeout kills it).
  // Throws LaunchError if the child cannot be started at all.
  virtual ExecResult Execute(const ProcessSpec&) = 0;
};

// fork + execv; the child inherits stdin/stdout/stderr
class ForkExecExecutor : public ProcessExecutor {
 public:
  ExecResult Execute(const ProcessSpec&) override;
};

#endif  // INCLUDE_VMRUN_PROCESS_H_
