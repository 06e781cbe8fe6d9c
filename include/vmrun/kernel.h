#ifndef INCLUDE_VMRUN_KERNEL_H_
#define INCLUDE_VMRUN_KERNEL_H_

#include <string>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

// empty = use the kernel the host is running
extern fs::path kKernelPath;
extern fs::path kBootDir;

struct KernelImage {
  fs::path path;
};

class KernelLocator {
 public:
  virtual ~KernelLocator() = default;
  virtual std::optional<fs::path> Locate() const = 0;
  virtual std::string Describe() const = 0;
};

class FixedKernelLocator : public KernelLocator {
  fs::path path_;
 public:
  explicit FixedKernelLocator(fs::path path) : path_(std::move(path)) {}
  std::optional<fs::path> Locate() const override;
  std::string Describe() const override;
};

// <boot_dir>/vmlinuz-$(uname -r) and friends
class RunningKernelLocator : public KernelLocator {
  fs::path boot_dir_;
  std::string release_;
 public:
  // release is only overridden by tests
  explicit RunningKernelLocator(fs::path boot_dir = kBootDir, std::string release = "");
  std::optional<fs::path> Locate() const override;
  std::string Describe() const override;
  const std::string& Release() const { return release_; }
};

// throw ConfigurationError if nothing usable is found
KernelImage ResolveKernel(const KernelLocator&);

#endif  // INCLUDE_VMRUN_KERNEL_H_
