#include <signal.h>
#include <chrono>
#include <cstdlib>
#include <algorithm>
#include <gtest/gtest.h>
#include <vmrun/errors.h>
#include <vmrun/memory.h>
#include <vmrun/paths.h>
#include <vmrun/report.h>
#include <vmrun/run.h>

#include "utils.h"

namespace {

std::string MemoryArg(const ProcessSpec& spec) {
  auto it = std::find(spec.args.begin(), spec.args.end(), "-m");
  if (it == spec.args.end() || it + 1 == spec.args.end()) return "";
  return *(it + 1);
}

} // namespace

class RunGuestTest : public VmrunTest {
 protected:
  void SetUp() override {
    VmrunTest::SetUp();
    MakeImages();
    req.payload = payload;
    req.final_output = dir / "result.txt";
  }

  RunResult Run(ProcessExecutor& executor) {
    return RunGuest(req, FixedKernelLocator(kernel), executor);
  }

  RunRequest req;
};

TEST_F(RunGuestTest, Success) {
  FakeExecutor executor;
  executor.output = "42\r\n";
  executor.status = "0\r\n";
  RunResult res = Run(executor);
  EXPECT_EQ(res.outcome.kind, OutcomeKind::SUCCESS);
  EXPECT_EQ(res.outcome.exit_code, 0);
  EXPECT_EQ(ReadText(req.final_output), "42\n");
  EXPECT_EQ(res.kernel, kernel);
  EXPECT_EQ(res.payload_bytes, 4096u);
  // sinks default to files next to the output and stay after the run
  ASSERT_EQ(executor.specs.size(), 1u);
  EXPECT_EQ(executor.specs[0].channels[1].sink, OutputSinkPath(req.final_output));
  EXPECT_EQ(executor.specs[0].channels[2].sink, StatusSinkPath(req.final_output));
  EXPECT_TRUE(fs::exists(OutputSinkPath(req.final_output)));
}

TEST_F(RunGuestTest, GuestFailure) {
  FakeExecutor executor;
  executor.output = "partial\r\n";
  executor.status = "7\r\n";
  RunResult res = Run(executor);
  EXPECT_EQ(res.outcome.kind, OutcomeKind::FAILURE);
  EXPECT_EQ(res.outcome.exit_code, 7);
  EXPECT_FALSE(fs::exists(req.final_output));
}

TEST_F(RunGuestTest, GuestNeverReported) {
  FakeExecutor executor;
  executor.output = "booting...\r\n";
  RunResult res = Run(executor);
  EXPECT_EQ(res.outcome.kind, OutcomeKind::PROTOCOL_ERROR);
  EXPECT_EQ(res.outcome.exit_code, 99);
  EXPECT_FALSE(fs::exists(req.final_output));
}

TEST_F(RunGuestTest, MemoryBudgetReachesLauncher) {
  MakeImages(10'000'000);
  FakeExecutor executor;
  executor.status = "0\r\n";
  RunResult res = Run(executor);
  EXPECT_EQ(res.payload_bytes, 10'000'000u);
  EXPECT_EQ(res.memory_mib, EstimateMemory(10'000'000));
  EXPECT_GT(res.memory_mib * (long)kMiB, 20'000'000);
  ASSERT_EQ(executor.specs.size(), 1u);
  EXPECT_EQ(MemoryArg(executor.specs[0]), std::to_string(res.memory_mib) + "M");
}

TEST_F(RunGuestTest, CustomSinks) {
  req.output_sink = dir / "serial" / "out";
  req.status_sink = dir / "serial" / "rc";
  FakeExecutor executor;
  executor.output = "x";
  executor.status = "0";
  Run(executor);
  EXPECT_EQ(ReadText(req.output_sink), "x");
  EXPECT_EQ(ReadText(req.status_sink), "0");
  EXPECT_EQ(ReadText(req.final_output), "x");
}

TEST_F(RunGuestTest, ConfigurationErrorsPreventLaunch) {
  FakeExecutor executor;
  {
    RunRequest bad = req;
    bad.payload = dir / "missing.img";
    EXPECT_THROW(RunGuest(bad, FixedKernelLocator(kernel), executor), ConfigurationError);
  }
  EXPECT_THROW(RunGuest(req, FixedKernelLocator(dir / "missing"), executor), ConfigurationError);
  {
    RunRequest bad = req;
    bad.status_sink = bad.final_output;
    EXPECT_THROW(RunGuest(bad, FixedKernelLocator(kernel), executor), ConfigurationError);
  }
  {
    RunRequest bad = req;
    bad.output_sink = PromoteTempPath(bad.final_output);
    EXPECT_THROW(RunGuest(bad, FixedKernelLocator(kernel), executor), ConfigurationError);
  }
  {
    RunRequest bad = req;
    bad.final_output = payload;
    EXPECT_THROW(RunGuest(bad, FixedKernelLocator(kernel), executor), ConfigurationError);
  }
  kMemoryMultiplier = 1.5;
  EXPECT_THROW(Run(executor), ConfigurationError);
  EXPECT_TRUE(executor.resolved.empty());
  EXPECT_TRUE(executor.specs.empty());
}

TEST_F(RunGuestTest, SinkOnPayloadKeepsPayload) {
  FakeExecutor executor;
  req.status_sink = payload;
  EXPECT_THROW(Run(executor), ConfigurationError);
  EXPECT_TRUE(executor.specs.empty());
  ASSERT_TRUE(fs::exists(payload));
  EXPECT_EQ(fs::file_size(payload), 4096u);
}

TEST_F(RunGuestTest, MissingHypervisor) {
  fs::path output_sink = OutputSinkPath(req.final_output);
  WriteText(output_sink, "stale");
  FakeExecutor executor;
  executor.found = false;
  EXPECT_THROW(Run(executor), LaunchError);
  EXPECT_EQ(ReadText(output_sink), "stale");
  EXPECT_FALSE(fs::exists(req.final_output));
}

TEST_F(RunGuestTest, Report) {
  FakeExecutor executor;
  executor.status = "3\r\n";
  RunResult res = Run(executor);
  nlohmann::json data = RunReportJSON(res);
  EXPECT_EQ(data["outcome"], "FAILURE");
  EXPECT_EQ(data["exit_code"], 3);
  EXPECT_EQ(data["payload_bytes"], 4096);
  EXPECT_EQ(data["memory_mb"], res.memory_mib);
  EXPECT_EQ(data["kernel"], kernel.string());
  EXPECT_EQ(data["timed_out"], false);

  fs::path report = dir / "report.json";
  ASSERT_TRUE(WriteReport(report, ErrorReportJSON("hypervisor qemu not found")));
  nlohmann::json parsed = nlohmann::json::parse(ReadText(report));
  EXPECT_EQ(parsed["outcome"], "ERROR");
  EXPECT_EQ(parsed["exit_code"], kFatalExitCode);
  EXPECT_EQ(parsed["message"], "hypervisor qemu not found");
}

// Real fork/exec against the fake-hypervisor binary built beside the tests
class FakeHypervisorTest : public RunGuestTest {
 protected:
  void SetUp() override {
    RunGuestTest::SetUp();
    kHypervisor = (kTestBinDir / "fake-hypervisor").string();
  }
  void TearDown() override {
    for (const char* key : {"FAKE_HV_OUTPUT", "FAKE_HV_STATUS", "FAKE_HV_EXIT", "FAKE_HV_SLEEP",
                            "FAKE_HV_IGNORE_TERM"}) {
      unsetenv(key);
    }
    RunGuestTest::TearDown();
  }
  ForkExecExecutor executor;
};

TEST_F(FakeHypervisorTest, Success) {
  setenv("FAKE_HV_OUTPUT", "line 1\nline 2\n", 1);
  setenv("FAKE_HV_STATUS", "0\n", 1);
  RunResult res = Run(executor);
  EXPECT_EQ(res.outcome.kind, OutcomeKind::SUCCESS);
  EXPECT_EQ(ReadText(OutputSinkPath(req.final_output)), "line 1\r\nline 2\r\n");
  EXPECT_EQ(ReadText(req.final_output), "line 1\nline 2\n");
}

TEST_F(FakeHypervisorTest, GuestFailure) {
  setenv("FAKE_HV_OUTPUT", "half\n", 1);
  setenv("FAKE_HV_STATUS", "7\n", 1);
  RunResult res = Run(executor);
  EXPECT_EQ(res.outcome.kind, OutcomeKind::FAILURE);
  EXPECT_EQ(res.outcome.exit_code, 7);
  EXPECT_FALSE(fs::exists(req.final_output));
}

TEST_F(FakeHypervisorTest, EmptyStatus) {
  setenv("FAKE_HV_OUTPUT", "half\n", 1);
  RunResult res = Run(executor);
  EXPECT_EQ(res.outcome.kind, OutcomeKind::PROTOCOL_ERROR);
  EXPECT_EQ(res.outcome.exit_code, kProtocolErrorCode);
  EXPECT_FALSE(fs::exists(req.final_output));
}

TEST_F(FakeHypervisorTest, HypervisorError) {
  setenv("FAKE_HV_STATUS", "0\n", 1);
  setenv("FAKE_HV_EXIT", "1", 1);
  EXPECT_THROW(Run(executor), LaunchError);
  EXPECT_FALSE(fs::exists(req.final_output));
}

TEST_F(FakeHypervisorTest, NotExecutable) {
  fs::path fake = dir / "qemu";
  WriteText(fake, "#!/bin/sh\n");
  fs::permissions(fake, fs::perms::owner_read | fs::perms::owner_write);
  kHypervisor = fake.string();
  EXPECT_THROW(Run(executor), LaunchError);
}

TEST_F(FakeHypervisorTest, ExecFailure) {
  // executable bit set but not a loadable image
  fs::path fake = dir / "qemu";
  WriteText(fake, "garbage");
  fs::permissions(fake, fs::perms::owner_all);
  ProcessSpec spec;
  spec.binary = fake;
  EXPECT_THROW(executor.Execute(spec), LaunchError);
}

TEST_F(FakeHypervisorTest, Timeout) {
  setenv("FAKE_HV_SLEEP", "30", 1);
  kTimeout = 1;
  RunResult res = Run(executor);
  EXPECT_TRUE(res.exec.timed_out);
  EXPECT_EQ(res.outcome.kind, OutcomeKind::PROTOCOL_ERROR);
  EXPECT_EQ(res.outcome.exit_code, kProtocolErrorCode);
}

TEST_F(FakeHypervisorTest, TimeoutEscalatesToKill) {
  setenv("FAKE_HV_SLEEP", "30", 1);
  setenv("FAKE_HV_IGNORE_TERM", "1", 1);
  kTimeout = 1;
  RunResult res = Run(executor);
  EXPECT_TRUE(res.exec.timed_out);
  EXPECT_EQ(res.exec.signal, SIGKILL);
  EXPECT_EQ(res.outcome.kind, OutcomeKind::PROTOCOL_ERROR);
}

TEST_F(FakeHypervisorTest, WaitErrorDoesNotSignal) {
  // with SIGCHLD ignored the kernel reaps the child and waitpid fails
  signal(SIGCHLD, SIG_IGN);
  ProcessSpec spec;
  spec.binary = kTestBinDir / "fake-hypervisor";
  spec.timeout = 10;
  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(executor.Execute(spec), LaunchError);
  signal(SIGCHLD, SIG_DFL);
  // no SIGTERM grace period was spent
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}
