#ifndef INCLUDE_VMRUN_RUN_H_
#define INCLUDE_VMRUN_RUN_H_

#include <cstdint>
#include <filesystem>

#include "kernel.h"
#include "process.h"
#include "decoder.h"

namespace fs = std::filesystem;

struct RunRequest {
  fs::path payload;
  fs::path final_output;
  // empty = derived from final_output
  fs::path output_sink, status_sink;
};

struct RunResult {
  uint64_t payload_bytes;
  long memory_mib;
  fs::path kernel;
  ExecResult exec;
  RunOutcome outcome;

  RunResult() : payload_bytes(0), memory_mib(0), outcome{OutcomeKind::PROTOCOL_ERROR, kProtocolErrorCode} {}
};

// Estimate -> Launch -> Decode.
// ConfigurationError and LaunchError propagate; guest failures are returned.
RunResult RunGuest(const RunRequest&, const KernelLocator&, ProcessExecutor&);

#endif  // INCLUDE_VMRUN_RUN_H_
