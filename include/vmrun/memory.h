#ifndef INCLUDE_VMRUN_MEMORY_H_
#define INCLUDE_VMRUN_MEMORY_H_

#include <cstdint>

constexpr uint64_t kMiB = 1024 * 1024;
// 4 TiB; more than any host can give a single guest
constexpr long kMaxMemoryMiB = 4L * 1024 * 1024;
constexpr double kMaxMemoryMultiplier = 1024.0;

// MiB; enough to boot the guest kernel regardless of payload size
extern long kMemoryFloorMiB;
// guest RAM per payload byte; the guest kernel refuses an initrd that takes
//   half of the RAM or more, so this must be greater than 2
extern double kMemoryMultiplier;

// Returns MiB. Monotonic in payload_bytes; the result in bytes is always
//   > 2 * payload_bytes and >= floor_mib. Saturates at LONG_MAX, which
//   CheckMemoryBudget rejects.
long EstimateMemory(uint64_t payload_bytes,
                    long floor_mib = kMemoryFloorMiB, double multiplier = kMemoryMultiplier);

// throw ConfigurationError; the budget must not exceed kMaxMemoryMiB
void ValidateMemoryPolicy(long floor_mib, double multiplier);
void CheckMemoryBudget(uint64_t payload_bytes, long memory_mib, long floor_mib = kMemoryFloorMiB);

#endif  // INCLUDE_VMRUN_MEMORY_H_
