#include <vmrun/run.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <vmrun/errors.h>
#include <vmrun/memory.h>
#include <vmrun/paths.h>
#include <vmrun/launcher.h>

namespace {

void CheckNotOutput(const char* name, const fs::path& path, const fs::path& final_output) {
  if (SamePath(path, final_output) || SamePath(path, PromoteTempPath(final_output))) {
    throw ConfigurationError(fmt::format("{} must differ from the output file {} and its staging file",
                                         name, final_output.c_str()));
  }
}

} // namespace

RunResult RunGuest(const RunRequest& req, const KernelLocator& locator, ProcessExecutor& executor) {
  if (req.final_output.empty()) throw ConfigurationError("output path is empty");
  std::error_code ec;
  if (req.payload.empty() || !fs::is_regular_file(req.payload, ec)) {
    throw ConfigurationError("boot payload " + req.payload.string() + " does not exist");
  }

  RunResult ret;
  SandboxRun run;
  run.payload.path = req.payload;
  run.payload.size_bytes = ret.payload_bytes = fs::file_size(req.payload, ec);
  if (ec) {
    throw ConfigurationError(fmt::format("cannot stat {}: {}", req.payload.c_str(), ec.message()));
  }
  ValidateMemoryPolicy(kMemoryFloorMiB, kMemoryMultiplier);
  run.memory_mib = ret.memory_mib = EstimateMemory(run.payload.size_bytes);
  CheckMemoryBudget(run.payload.size_bytes, run.memory_mib);

  run.kernel = ResolveKernel(locator);
  ret.kernel = run.kernel.path;
  run.output_sink = req.output_sink.empty() ? OutputSinkPath(req.final_output) : req.output_sink;
  run.status_sink = req.status_sink.empty() ? StatusSinkPath(req.final_output) : req.status_sink;
  CheckNotOutput("output sink", run.output_sink, req.final_output);
  CheckNotOutput("status sink", run.status_sink, req.final_output);
  CheckNotOutput("boot payload", run.payload.path, req.final_output);
  CheckNotOutput("kernel image", run.kernel.path, req.final_output);
  run.enable_kvm = ResolveKvm(kKvmMode);
  run.Validate();

  ret.exec = Launch(run, executor);
  ret.outcome = DecodeResult(run.output_sink, run.status_sink, req.final_output);
  return ret;
}
