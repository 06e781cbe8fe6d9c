#include "utils.h"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vmrun/kernel.h>
#include <vmrun/memory.h>

fs::path MakeTempDir() {
  char path[] = "/tmp/vmrun_test_XXXXXX";
  if (!mkdtemp(path)) throw std::runtime_error("Failed to create temporary directory");
  return path;
}

void WriteText(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  fout << content;
}

std::string ReadText(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
}

std::optional<fs::path> FakeExecutor::Resolve(const std::string& binary) const {
  resolved.push_back(binary);
  if (!found) return std::nullopt;
  return fs::path("/fake/bin") / binary;
}

ExecResult FakeExecutor::Execute(const ProcessSpec& spec) {
  specs.push_back(spec);
  if (write_sinks) {
    WriteText(spec.channels.at(1).sink, output);
    WriteText(spec.channels.at(2).sink, status.value_or(""));
  }
  return result;
}

void VmrunTest::SetUp() {
  hypervisor_ = kHypervisor;
  init_program_ = kInitProgram;
  console_loglevel_ = kConsoleLoglevel;
  kvm_mode_ = kKvmMode;
  timeout_ = kTimeout;
  memory_floor_mib_ = kMemoryFloorMiB;
  memory_multiplier_ = kMemoryMultiplier;
  kernel_path_ = kKernelPath;
  boot_dir_ = kBootDir;
  kKvmMode = KvmMode::OFF;
  dir = MakeTempDir();
}

void VmrunTest::TearDown() {
  kHypervisor = hypervisor_;
  kInitProgram = init_program_;
  kConsoleLoglevel = console_loglevel_;
  kKvmMode = kvm_mode_;
  kTimeout = timeout_;
  kMemoryFloorMiB = memory_floor_mib_;
  kMemoryMultiplier = memory_multiplier_;
  kKernelPath = kernel_path_;
  kBootDir = boot_dir_;
  fs::remove_all(dir);
}

void VmrunTest::MakeImages(uint64_t payload_bytes) {
  kernel = dir / "vmlinuz";
  payload = dir / "initrd.img";
  WriteText(kernel, "kernel");
  WriteText(payload, "");
  fs::resize_file(payload, payload_bytes);
}
