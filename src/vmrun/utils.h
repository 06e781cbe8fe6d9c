#ifndef VMRUN_UTILS_H_
#define VMRUN_UTILS_H_

#include <string>
#include <filesystem>

#include <vmrun/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

bool CreateDirs(const fs::path&);
// true if the file is gone afterwards (including never existed)
bool RemoveFile(const fs::path&);
// allow cross-device move; overwrite the destination
bool Move(const fs::path& from, const fs::path& to);

// a missing file reads as empty
bool ReadFile(const fs::path&, std::string& content);
bool WriteFile(const fs::path&, const std::string& content);

#endif  // VMRUN_UTILS_H_
