// File: src/core/util/logging.cpp
#include "nm/core/util/logging.hpp"

#include <spdlog/spdlog.h>

namespace nm {

Status configure_logging(const LoggingConfig& cfg) {
  const auto level = spdlog::level::from_str(cfg.level);
  // from_str maps unknown names to "off"; only accept that when asked for.
  if (level == spdlog::level::off && cfg.level != "off") {
    return Status::invalid_argument("unknown logging.level: " + cfg.level);
  }

  spdlog::set_level(level);
  if (!cfg.pattern.empty()) spdlog::set_pattern(cfg.pattern);
  return Status::ok_status();
}

}  // namespace nm
