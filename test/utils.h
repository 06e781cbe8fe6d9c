#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <gtest/gtest.h>
#include <vmrun/launcher.h>
#include <vmrun/process.h>

namespace fs = std::filesystem;

// directory of the test executable; fake-hypervisor lives there
extern fs::path kTestBinDir;

fs::path MakeTempDir();
void WriteText(const fs::path&, const std::string&);
std::string ReadText(const fs::path&);

// Records every spec instead of starting a process, and plays the guest by
//   writing output/status into the capture channels.
class FakeExecutor : public ProcessExecutor {
 public:
  bool found;
  bool write_sinks;
  std::string output;
  std::optional<std::string> status; // nullopt = leave the status sink empty
  ExecResult result;
  mutable std::vector<std::string> resolved;
  std::vector<ProcessSpec> specs;

  FakeExecutor() : found(true), write_sinks(true) { result.exit_code = 0; }

  std::optional<fs::path> Resolve(const std::string& binary) const override;
  ExecResult Execute(const ProcessSpec&) override;
};

// A scratch directory plus save/restore of the global settings
class VmrunTest : public ::testing::Test {
  std::string hypervisor_, init_program_;
  int console_loglevel_;
  KvmMode kvm_mode_;
  long timeout_, memory_floor_mib_;
  double memory_multiplier_;
  fs::path kernel_path_, boot_dir_;
 protected:
  void SetUp() override;
  void TearDown() override;

  // a kernel and a payload of the given size inside dir
  void MakeImages(uint64_t payload_bytes = 4096);

  fs::path dir, kernel, payload;
};

#endif // TEST_UTILS_H_
