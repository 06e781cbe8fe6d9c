#include <vmrun/report.h>

#include <spdlog/spdlog.h>
#include "utils.h"

nlohmann::json RunReportJSON(const RunResult& res) {
  nlohmann::json data{
      {"outcome", OutcomeKindName(res.outcome.kind)},
      {"exit_code", res.outcome.exit_code},
      {"payload_bytes", res.payload_bytes},
      {"memory_mb", res.memory_mib},
      {"kernel", res.kernel.string()},
      {"timed_out", res.exec.timed_out}};
  return data;
}

nlohmann::json ErrorReportJSON(const std::string& message) {
  return nlohmann::json{
      {"outcome", "ERROR"},
      {"exit_code", kFatalExitCode},
      {"message", message}};
}

bool WriteReport(const fs::path& path, const nlohmann::json& data) {
  spdlog::debug("Writing report {}", path.c_str());
  return WriteFile(path, data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + '\n');
}
