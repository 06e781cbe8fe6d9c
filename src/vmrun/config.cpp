#include <vmrun/config.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <vmrun/errors.h>
#include <vmrun/kernel.h>
#include <vmrun/memory.h>
#include <vmrun/launcher.h>
#include <vmrun/utils.h>

namespace {

KvmMode ParseKvmMode(const std::string& str, const char* source) {
  auto mode = GetKvmMode(str);
  if (!mode) {
    throw ConfigurationError(std::string(source) + ": invalid kvm mode \"" + str + "\"");
  }
  return *mode;
}

} // namespace

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string hypervisor = ini[""]["hypervisor"] | "";
  std::string kernel = ini[""]["kernel"] | "";
  std::string boot_dir = ini[""]["boot_dir"] | "";
  std::string init = ini[""]["init"] | "";
  std::string kvm = ini[""]["kvm"] | "";
  if (hypervisor.size()) kHypervisor = hypervisor;
  if (kernel.size()) kKernelPath = kernel;
  if (boot_dir.size()) kBootDir = boot_dir;
  if (init.size()) kInitProgram = init;
  if (kvm.size()) kKvmMode = ParseKvmMode(kvm, conf_path.c_str());
  kConsoleLoglevel = ini[""]["console_loglevel"] | kConsoleLoglevel;
  kMemoryFloorMiB = ini[""]["memory_floor_mb"] | kMemoryFloorMiB;
  kMemoryMultiplier = ini[""]["memory_multiplier"] | kMemoryMultiplier;
  kTimeout = ini[""]["timeout"] | kTimeout;
  ValidateMemoryPolicy(kMemoryFloorMiB, kMemoryMultiplier);
  spdlog::debug("Loaded {}: hypervisor={} floor={}M multiplier={} kvm={} timeout={}",
                conf_path.c_str(), kHypervisor, kMemoryFloorMiB, kMemoryMultiplier,
                KvmModeName(kKvmMode), kTimeout);
  return true;
}

void ApplyEnvironment() {
  if (GetEnvBool(kEnvHypervisor)) kHypervisor = GetEnvString(kEnvHypervisor);
  if (GetEnvBool(kEnvKernel)) kKernelPath = GetEnvString(kEnvKernel);
  if (GetEnvBool(kEnvKvm)) kKvmMode = ParseKvmMode(GetEnvString(kEnvKvm), kEnvKvm);
  kTimeout = GetEnvInt(kEnvTimeout, kTimeout);
}

long GetEnvInt(const char* key, long default_value) {
  const char* val = getenv(key);
  if (!val || !*val) return default_value;
  char* end;
  errno = 0;
  long ret = strtol(val, &end, 10);
  if (errno || *end) {
    spdlog::warn("Ignoring {}={}: not an integer", key, val);
    return default_value;
  }
  return ret;
}

bool GetEnvBool(const char* key) {
  const char* val = getenv(key);
  return val && *val;
}

std::string GetEnvString(const char* key) {
  const char* val = getenv(key);
  return val ? val : "";
}
