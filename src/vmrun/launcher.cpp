#include <vmrun/launcher.h>

#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <vmrun/errors.h>
#include <vmrun/paths.h>
#include "utils.h"

std::string kHypervisor = "qemu-system-x86_64";
std::string kInitProgram = "/init";
int kConsoleLoglevel = 3;
KvmMode kKvmMode = KvmMode::AUTO;
long kTimeout = 0;

namespace {

constexpr char kKvmDevice[] = "/dev/kvm";

void CheckSinkPath(const char* name, const fs::path& path) {
  if (path.empty()) throw ConfigurationError(fmt::format("{} sink path is empty", name));
  // QEMU splits chardev options on commas
  if (path.string().find(',') != std::string::npos) {
    throw ConfigurationError(fmt::format("{} sink path {} must not contain ','", name, path.c_str()));
  }
}

} // namespace

void SandboxRun::Validate() const {
  if (hypervisor.empty()) throw ConfigurationError("hypervisor is not set");
  if (memory_mib <= 0) throw ConfigurationError("memory budget is not set");
  std::error_code ec;
  if (payload.path.empty() || !fs::is_regular_file(payload.path, ec)) {
    throw ConfigurationError("boot payload " + payload.path.string() + " does not exist");
  }
  if (kernel.path.empty() || !fs::is_regular_file(kernel.path, ec)) {
    throw ConfigurationError("kernel image " + kernel.path.string() + " does not exist");
  }
  if (init_program.empty() || init_program[0] != '/' ||
      init_program.find_first_of(" \t\n\"") != std::string::npos) {
    throw ConfigurationError("init program must be an absolute path without blanks: " + init_program);
  }
  if (console_loglevel < 0 || console_loglevel > 7) {
    throw ConfigurationError(fmt::format("console loglevel {} out of range 0-7", console_loglevel));
  }
  if (timeout < 0) throw ConfigurationError(fmt::format("timeout {} is negative", timeout));
  CheckSinkPath("output", output_sink);
  CheckSinkPath("status", status_sink);
  if (SamePath(output_sink, status_sink)) {
    throw ConfigurationError("output and status sinks are the same file " + output_sink.string());
  }
  // sinks are deleted before launch
  for (const fs::path* sink : {&output_sink, &status_sink}) {
    if (SamePath(*sink, payload.path) || SamePath(*sink, kernel.path)) {
      throw ConfigurationError("sink " + sink->string() + " would overwrite a boot image");
    }
  }
}

bool KvmAvailable() {
  return access(kKvmDevice, R_OK | W_OK) == 0;
}

bool ResolveKvm(KvmMode mode) {
  switch (mode) {
    case KvmMode::OFF: return false;
    case KvmMode::ON: return true;
    case KvmMode::AUTO: {
      bool ret = KvmAvailable();
      spdlog::debug("KVM auto-detection: {} {}", kKvmDevice, ret ? "usable" : "unusable");
      return ret;
    }
  }
  __builtin_unreachable();
}

std::string KernelCommandLine(const SandboxRun& run) {
  // panic=-1 reboots on panic, which -no-reboot turns into a hypervisor exit
  return fmt::format("rdinit={} panic=-1 console=ttyS0 loglevel={}",
                     run.init_program, run.console_loglevel);
}

ProcessSpec BuildProcessSpec(const SandboxRun& run, const fs::path& binary) {
  ProcessSpec spec;
  spec.binary = binary;
  spec.args = {
    "-m", fmt::format("{}M", run.memory_mib),
    "-kernel", run.kernel.path.string(),
    "-initrd", run.payload.path.string(),
    "-append", KernelCommandLine(run),
    "-no-reboot",
    "-display", "none",
    "-vga", "none",
  };
  if (run.enable_kvm) spec.args.push_back("-enable-kvm");
  spec.channels = {
    {ChannelMode::INTERACTIVE, {}},
    {ChannelMode::CAPTURE, run.output_sink},
    {ChannelMode::CAPTURE, run.status_sink},
  };
  spec.timeout = run.timeout;
  return spec;
}

ExecResult Launch(const SandboxRun& run, ProcessExecutor& executor) {
  // must fail before the sinks are touched
  auto binary = executor.Resolve(run.hypervisor);
  if (!binary) throw LaunchError("hypervisor " + run.hypervisor + " not found");

  for (const fs::path* sink : {&run.output_sink, &run.status_sink}) {
    fs::path dir = sink->parent_path();
    if (!dir.empty() && !CreateDirs(dir)) {
      throw LaunchError("cannot create sink directory " + dir.string());
    }
    if (!RemoveFile(*sink)) throw LaunchError("cannot remove stale sink " + sink->string());
  }

  ProcessSpec spec = BuildProcessSpec(run, *binary);
  spdlog::info("Launching {} memory={}M kernel={} payload={} kvm={}",
               spec.binary.c_str(), run.memory_mib, run.kernel.path.c_str(),
               run.payload.path.c_str(), run.enable_kvm);
  for (size_t i = 0; i < spec.channels.size(); i++) {
    spdlog::debug("Serial channel ttyS{}: {} {}", i,
                  ChannelModeName(spec.channels[i].mode), spec.channels[i].Backend());
  }

  ExecResult res = executor.Execute(spec);
  if (res.timed_out) {
    spdlog::warn("Guest did not halt within {}s", spec.timeout);
    return res;
  }
  if (!res.Exited()) {
    throw LaunchError(fmt::format("hypervisor killed by signal {}", res.signal));
  }
  if (res.exit_code != 0) {
    throw LaunchError(fmt::format("hypervisor exited with status {}", res.exit_code));
  }
  spdlog::info("Hypervisor exited normally");
  return res;
}
