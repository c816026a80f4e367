#include "log.hpp"
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

std::optional<std::string> log_path() {
  const char* p = std::getenv("PANEFM_LOG");
  if (!p || !*p) return std::nullopt;
  return std::string(p);
}

void init_logging(const std::optional<std::string>& path) {
  std::shared_ptr<spdlog::logger> logger;
  if (path) {
    try {
      auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*path, false);
      logger = std::make_shared<spdlog::logger>("panefm", sink);
    } catch (const spdlog::spdlog_ex& e) {
      // the terminal is not ours yet, so stderr is still usable
      std::fprintf(stderr, "panefm: opening log file: %s\n", e.what());
    }
  }
  if (!logger) {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger = std::make_shared<spdlog::logger>("panefm", sink);
  }
  spdlog::set_default_logger(logger);
  spdlog::set_level(std::getenv("PANEFM_DEBUG") ? spdlog::level::debug : spdlog::level::info);
  spdlog::flush_on(spdlog::level::warn);
}
