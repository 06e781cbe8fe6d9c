#ifndef INCLUDE_VMRUN_CONFIG_H_
#define INCLUDE_VMRUN_CONFIG_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

constexpr char kEnvHypervisor[] = "VMRUN_HYPERVISOR";
constexpr char kEnvKernel[] = "VMRUN_KERNEL";
constexpr char kEnvKvm[] = "VMRUN_KVM";
constexpr char kEnvTimeout[] = "VMRUN_TIMEOUT";
constexpr char kEnvVerbose[] = "VMRUN_VERBOSE";

// Load the global section of an INI file into the k* settings.
// Throws ConfigurationError on invalid values; returns false if unreadable.
bool ParseConfig(const fs::path&);
// VMRUN_* overrides, applied after the config file
void ApplyEnvironment();

long GetEnvInt(const char* key, long default_value);
// set and non-empty
bool GetEnvBool(const char* key);
std::string GetEnvString(const char* key);

#endif  // INCLUDE_VMRUN_CONFIG_H_
