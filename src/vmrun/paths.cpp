#include <vmrun/paths.h>

namespace {

inline fs::path WithSuffix(const fs::path& path, const char* suffix) {
  fs::path ret = path;
  ret += suffix;
  return ret;
}

fs::path CanonicalPath(const fs::path& path) {
  std::error_code ec;
  fs::path abs = fs::absolute(path, ec);
  if (ec) return path.lexically_normal();
  fs::path ret = fs::weakly_canonical(abs, ec);
  if (ec) return abs.lexically_normal();
  return ret;
}

} // namespace

fs::path OutputSinkPath(const fs::path& final_output) {
  return WithSuffix(final_output, ".ttyS1");
}
fs::path StatusSinkPath(const fs::path& final_output) {
  return WithSuffix(final_output, ".ttyS2");
}
fs::path PromoteTempPath(const fs::path& final_output) {
  return WithSuffix(final_output, ".tmp");
}

fs::path DefaultConfigPath() {
  return "/etc/vmrun.conf";
}

bool SamePath(const fs::path& a, const fs::path& b) {
  if (CanonicalPath(a) == CanonicalPath(b)) return true;
  std::error_code ec;
  return fs::equivalent(a, b, ec) && !ec;
}
