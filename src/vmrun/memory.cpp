#include <vmrun/memory.h>

#include <cmath>
#include <limits>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <vmrun/errors.h>

long kMemoryFloorMiB = 128;
double kMemoryMultiplier = 3.0;

long EstimateMemory(uint64_t payload_bytes, long floor_mib, double multiplier) {
  // scaled * kMiB >= payload_bytes * multiplier
  constexpr long kLongMax = std::numeric_limits<long>::max();
  long double scaled = std::ceil((long double)payload_bytes * multiplier / kMiB);
  // also catches NaN
  if (!(scaled < (long double)kLongMax - std::max(floor_mib, 0L))) return kLongMax;
  return (long)scaled + floor_mib;
}

void ValidateMemoryPolicy(long floor_mib, double multiplier) {
  if (floor_mib <= 0 || floor_mib > kMaxMemoryMiB) {
    throw ConfigurationError(fmt::format("memory floor must be in 1-{} MiB, got {} MiB",
                                         kMaxMemoryMiB, floor_mib));
  }
  if (!std::isfinite(multiplier) || multiplier <= 2.0 || multiplier > kMaxMemoryMultiplier) {
    throw ConfigurationError(fmt::format(
        "memory multiplier must be greater than 2 (initrd must stay below half of RAM) "
        "and at most {}, got {}", kMaxMemoryMultiplier, multiplier));
  }
}

void CheckMemoryBudget(uint64_t payload_bytes, long memory_mib, long floor_mib) {
  if (memory_mib < floor_mib || memory_mib > kMaxMemoryMiB ||
      (long double)memory_mib * kMiB <= 2.0L * (long double)payload_bytes) {
    throw ConfigurationError(fmt::format(
        "memory budget {} MiB cannot boot a payload of {} bytes (floor {} MiB)",
        memory_mib, payload_bytes, floor_mib));
  }
  spdlog::debug("Memory budget: payload={} bytes memory={} MiB", payload_bytes, memory_mib);
}
