#include "ferry/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace ferry::core {

ferry::Result<void> set_log_level(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return ferry::Err<void>(ferry::Error::config("unknown log level '" + level + "'"));
    }
    spdlog::set_level(parsed);
    return ferry::Ok();
}

ferry::Result<void> configure_logging(const EngineConfig& config) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    return set_log_level(config.log_level);
}

} // namespace ferry::core
