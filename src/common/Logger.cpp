#include "common/Logger.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sgw::common {

std::shared_ptr<spdlog::logger> Logger::init(const std::string& sLevel) {
  auto level = spdlog::level::from_str(sLevel);

  auto spExisting = spdlog::get("sgw");
  if (spExisting) {
    // Re-initialization: just update level
    spExisting->set_level(level);
    return spExisting;
  }

  auto spLogger = spdlog::stdout_color_mt("sgw");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  spLogger->info("Logger initialized at level '{}'", sLevel);
  return spLogger;
}

std::shared_ptr<spdlog::logger> Logger::null() {
  return std::make_shared<spdlog::logger>("null",
                                          std::make_shared<spdlog::sinks::null_sink_mt>());
}

}  // namespace sgw::common
