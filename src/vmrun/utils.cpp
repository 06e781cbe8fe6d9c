#include "utils.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG1(OutcomeKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeKindName, OutcomeKind, ENUM_OUTCOME_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(ChannelMode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ChannelModeName, ChannelMode, ENUM_CHANNEL_MODE_)
#undef X

#define X(...) X_RETURN_ARG2(KvmMode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* KvmModeName, KvmMode, ENUM_KVM_MODE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

static const char* kKvmModeTable[] = {
#define X(name, str) str,
  ENUM_KVM_MODE_
#undef X
};

std::optional<KvmMode> GetKvmMode(const std::string& str) {
  for (size_t i = 0; i < sizeof(kKvmModeTable) / sizeof(kKvmModeTable[0]); i++) {
    if (str == kKvmModeTable[i]) return (KvmMode)i;
  }
  if (str == "1" || str == "yes" || str == "on") return KvmMode::ON;
  if (str == "0" || str == "no" || str == "off") return KvmMode::OFF;
  return std::nullopt;
}

bool CreateDirs(const fs::path& path) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool RemoveFile(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool Move(const fs::path& from, const fs::path& to) {
  spdlog::debug("Move file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec) {
    if (ec.value() != EXDEV) goto err;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) goto err;
    fs::remove(from, ec);
  }
  return true;
err:
  spdlog::warn("Failed moving {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}

bool ReadFile(const fs::path& path, std::string& content) {
  content.clear();
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    spdlog::debug("{} does not exist, reading as empty", path.c_str());
    return !ec;
  }
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    spdlog::warn("Failed opening {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  content.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  if (fin.bad()) {
    spdlog::warn("Failed reading {}", path.c_str());
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout) {
    spdlog::warn("Failed opening {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  fout.write(content.data(), content.size());
  fout.close();
  if (!fout) {
    spdlog::warn("Failed writing {}", path.c_str());
    return false;
  }
  return true;
}
