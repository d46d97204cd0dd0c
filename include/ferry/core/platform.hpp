#pragma once

#include "ferry/core/clock.hpp"
#include "ferry/core/result.hpp"

#include <cstdint>
#include <filesystem>

namespace ferry::core {

struct FileTimes {
    TimePoint modified_at{};
    TimePoint changed_at{};
};

/// POSIX stat timestamps, truncated to milliseconds so they round-trip through the wire.
ferry::Result<FileTimes> file_times(const std::filesystem::path& path, bool follow_links = true);

std::int64_t to_unix_millis(TimePoint time) noexcept;
TimePoint from_unix_millis(std::int64_t millis) noexcept;

} // namespace ferry::core
