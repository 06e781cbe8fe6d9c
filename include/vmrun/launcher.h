#ifndef INCLUDE_VMRUN_LAUNCHER_H_
#define INCLUDE_VMRUN_LAUNCHER_H_

#include <string>
#include <cstdint>
#include <filesystem>

#include "kernel.h"
#include "process.h"

#define ENUM_KVM_MODE_ \
  X(OFF, "false") \
  X(AUTO, "auto") \
  X(ON, "true")
enum class KvmMode {
#define X(name, str) name,
  ENUM_KVM_MODE_
#undef X
};

extern std::string kHypervisor;
extern std::string kInitProgram;
extern int kConsoleLoglevel;
extern KvmMode kKvmMode;
extern long kTimeout; // seconds

struct BootPayload {
  fs::path path;
  uint64_t size_bytes;
};

class SandboxRun {
 public:
  long memory_mib;
  BootPayload payload;
  KernelImage kernel;
  // channel 0 is always the host stdio
  fs::path output_sink, status_sink;

  std::string hypervisor;
  std::string init_program; // path inside the guest
  int console_loglevel;
  bool enable_kvm;
  long timeout; // seconds, 0 = no limit

  SandboxRun() :
      memory_mib(0),
      payload{{}, 0},
      hypervisor(kHypervisor),
      init_program(kInitProgram),
      console_loglevel(kConsoleLoglevel),
      enable_kvm(false),
      timeout(kTimeout) {}

  // throw ConfigurationError
  void Validate() const;
};

bool KvmAvailable();
bool ResolveKvm(KvmMode);

std::string KernelCommandLine(const SandboxRun&);
// pure; binary is the resolved hypervisor path
ProcessSpec BuildProcessSpec(const SandboxRun&, const fs::path& binary);

// Resolve the hypervisor, clear the sinks and run it to completion.
// Throws LaunchError; a returned result is either a normal exit or a timeout.
ExecResult Launch(const SandboxRun&, ProcessExecutor&);

#endif  // INCLUDE_VMRUN_LAUNCHER_H_
