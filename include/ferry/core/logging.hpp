#pragma once

#include "ferry/core/config.hpp"
#include "ferry/core/result.hpp"

#include <string>

namespace ferry::core {

/// Applies config.log_level and the engine log pattern to the default spdlog logger.
ferry::Result<void> configure_logging(const EngineConfig& config);

ferry::Result<void> set_log_level(const std::string& level);

} // namespace ferry::core
