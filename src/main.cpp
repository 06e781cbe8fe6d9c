#include <memory>
#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <vmrun/logger.h>
#include <vmrun/config.h>
#include <vmrun/errors.h>
#include <vmrun/kernel.h>
#include <vmrun/launcher.h>
#include <vmrun/paths.h>
#include <vmrun/process.h>
#include <vmrun/report.h>
#include <vmrun/run.h>

namespace {

struct Args {
  RunRequest request;
  fs::path report;
};

Args ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "vmrun");
  parser.add_argument("payload")
    .help("Boot payload (initramfs) containing the guest program");
  parser.add_argument("output")
    .help("Where the guest output is written if it exits with status 0");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default: " + DefaultConfigPath().string() + ")");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-k", "--kernel")
    .help("Kernel image (default: the running kernel)");
  parser.add_argument("--hypervisor")
    .help("Hypervisor binary");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Seconds before the guest is terminated; 0 waits forever");
  parser.add_argument("--output-sink")
    .help("Host file backing the output serial channel (default: <output>.ttyS1)");
  parser.add_argument("--status-sink")
    .help("Host file backing the status serial channel (default: <output>.ttyS2)");
  parser.add_argument("--report")
    .help("Write a JSON run report to this path");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::exception& err) {
    // argparse throws logic_error subclasses for malformed numbers
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kFatalExitCode);
  }

  SetVerbosity(std::max<long>(verbosity, GetEnvInt(kEnvVerbose, 0)));
  if (auto config_file = parser.present("--config")) {
    if (!ParseConfig(*config_file)) {
      spdlog::error("Failed to parse configuration file {}", *config_file);
      exit(kFatalExitCode);
    }
  } else if (!ParseConfig(DefaultConfigPath())) {
    spdlog::info("No configuration file at {}, using defaults", DefaultConfigPath().c_str());
  }
  ApplyEnvironment();
  if (auto val = parser.present("--kernel")) kKernelPath = *val;
  if (auto val = parser.present("--hypervisor")) kHypervisor = *val;
  if (auto val = parser.present<long>("--timeout")) kTimeout = *val;

  Args ret;
  ret.request.payload = parser.get<std::string>("payload");
  ret.request.final_output = parser.get<std::string>("output");
  if (auto val = parser.present("--output-sink")) ret.request.output_sink = *val;
  if (auto val = parser.present("--status-sink")) ret.request.status_sink = *val;
  if (auto val = parser.present("--report")) ret.report = *val;
  return ret;
}

void Report(const fs::path& path, const nlohmann::json& data) {
  if (path.empty()) return;
  if (!WriteReport(path, data)) spdlog::error("Failed to write report {}", path.c_str());
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  Args args;
  try {
    args = ParseArgs(argc, argv);
  } catch (const VmrunError& err) {
    spdlog::error("{}", err.what());
    return kFatalExitCode;
  }

  std::unique_ptr<KernelLocator> locator;
  if (kKernelPath.empty()) {
    locator = std::make_unique<RunningKernelLocator>();
  } else {
    locator = std::make_unique<FixedKernelLocator>(kKernelPath);
  }
  ForkExecExecutor executor;
  try {
    RunResult res = RunGuest(args.request, *locator, executor);
    Report(args.report, RunReportJSON(res));
    return res.outcome.exit_code;
  } catch (const VmrunError& err) {
    spdlog::error("{}", err.what());
    Report(args.report, ErrorReportJSON(err.what()));
    return kFatalExitCode;
  }
}
