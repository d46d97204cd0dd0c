#include "ferry/core/platform.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>

namespace ferry::core {
namespace {

TimePoint from_timespec(const struct timespec& ts) {
    const std::int64_t millis = static_cast<std::int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
    return from_unix_millis(millis);
}

} // namespace

ferry::Result<FileTimes> file_times(const std::filesystem::path& path, bool follow_links) {
    struct stat info {};
    const int rc = follow_links ? ::stat(path.c_str(), &info) : ::lstat(path.c_str(), &info);
    if (rc != 0) {
        return ferry::Err<FileTimes>(
            ferry::Error::manifest(std::string("stat failed: ") + std::strerror(errno), path.string()));
    }
    FileTimes times;
    times.modified_at = from_timespec(info.st_mtim);
    times.changed_at = from_timespec(info.st_ctim);
    return ferry::Ok(times);
}

std::int64_t to_unix_millis(TimePoint time) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint from_unix_millis(std::int64_t millis) noexcept {
    return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds{millis})};
}

} // namespace ferry::core
