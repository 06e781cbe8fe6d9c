#ifndef INCLUDE_VMRUN_REPORT_H_
#define INCLUDE_VMRUN_REPORT_H_

#include <string>
#include <filesystem>

#include <nlohmann/json.hpp>

#include "run.h"

namespace fs = std::filesystem;

// process exit code for ConfigurationError, LaunchError and other host faults
constexpr int kFatalExitCode = 125;

nlohmann::json RunReportJSON(const RunResult&);
nlohmann::json ErrorReportJSON(const std::string& message);
bool WriteReport(const fs::path&, const nlohmann::json&);

#endif  // INCLUDE_VMRUN_REPORT_H_
