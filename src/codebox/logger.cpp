#include <codebox/logger.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void InitLogger(int verbosity) {
  if (!spdlog::get("codebox")) spdlog::set_default_logger(spdlog::stderr_color_mt("codebox"));
  spdlog::set_pattern("[%t] %+");
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  spdlog::debug("Logger initialized with verbosity {}", verbosity);
}
