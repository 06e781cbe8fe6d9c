#include <vmrun/kernel.h>

#include <sys/utsname.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>
#include <vmrun/errors.h>

fs::path kKernelPath;
fs::path kBootDir = "/boot";

namespace {

std::string HostRelease() {
  struct utsname uts{};
  if (uname(&uts) < 0) {
    spdlog::warn("uname failed: {}", strerror(errno));
    return "";
  }
  return uts.release;
}

} // namespace

std::optional<fs::path> FixedKernelLocator::Locate() const {
  if (path_.empty()) return std::nullopt;
  return path_;
}

std::string FixedKernelLocator::Describe() const {
  return "kernel " + path_.string();
}

RunningKernelLocator::RunningKernelLocator(fs::path boot_dir, std::string release) :
    boot_dir_(std::move(boot_dir)), release_(std::move(release)) {
  if (release_.empty()) release_ = HostRelease();
}

std::optional<fs::path> RunningKernelLocator::Locate() const {
  if (release_.empty()) return std::nullopt;
  for (const char* prefix : {"vmlinuz-", "vmlinux-", "bzImage-"}) {
    fs::path candidate = boot_dir_ / (prefix + release_);
    std::error_code ec;
    spdlog::debug("Trying kernel {}", candidate.c_str());
    if (fs::is_regular_file(candidate, ec)) return candidate;
  }
  return std::nullopt;
}

std::string RunningKernelLocator::Describe() const {
  return "running kernel " + release_ + " in " + boot_dir_.string();
}

KernelImage ResolveKernel(const KernelLocator& locator) {
  auto path = locator.Locate();
  if (!path) throw ConfigurationError("cannot find " + locator.Describe());
  std::error_code ec;
  if (!fs::is_regular_file(*path, ec)) {
    throw ConfigurationError("kernel image " + path->string() + " does not exist");
  }
  spdlog::info("Using kernel {}", path->c_str());
  return KernelImage{*path};
}
