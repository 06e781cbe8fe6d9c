#include <vmrun/logger.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void InitLogger() {
  auto logger = spdlog::stderr_color_mt("vmrun");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%P] %+");
  spdlog::set_level(spdlog::level::warn);
}

void SetVerbosity(int verbosity) {
  if (verbosity <= 0) {
    spdlog::set_level(spdlog::level::warn);
  } else if (verbosity == 1) {
    spdlog::set_level(spdlog::level::info);
  } else {
    spdlog::set_level(spdlog::level::debug);
  }
}
