// File: include/nm/core/util/logging.hpp
#pragma once

#include "nm/core/config.hpp"
#include "nm/core/status.hpp"

namespace nm {

// Applies level + pattern to spdlog's default logger.
Status configure_logging(const LoggingConfig& cfg);

}  // namespace nm
