#ifndef INCLUDE_VMRUN_PATHS_H_
#define INCLUDE_VMRUN_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// serial sinks next to the final output, so concurrent runs with distinct
//   outputs never share them
fs::path OutputSinkPath(const fs::path& final_output);
fs::path StatusSinkPath(const fs::path& final_output);
// staging file for the promotion rename
fs::path PromoteTempPath(const fs::path& final_output);

fs::path DefaultConfigPath();

// true if both name the same file, through relative paths, symlinks and
//   hard links; neither needs to exist
bool SamePath(const fs::path&, const fs::path&);

#endif  // INCLUDE_VMRUN_PATHS_H_
