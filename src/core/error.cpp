#include "ferry/core/error.hpp"

#include <array>
#include <utility>

namespace ferry {
namespace {

constexpr std::array<std::pair<ErrorKind, const char*>, 11> kNames{{
    {ErrorKind::Manifest, "manifest"},
    {ErrorKind::Transport, "transport"},
    {ErrorKind::Storage, "storage"},
    {ErrorKind::Integrity, "integrity"},
    {ErrorKind::Resume, "resume"},
    {ErrorKind::Rejected, "rejected"},
    {ErrorKind::Cancelled, "cancelled"},
    {ErrorKind::Queue, "queue"},
    {ErrorKind::Config, "config"},
    {ErrorKind::Protocol, "protocol"},
    {ErrorKind::State, "state"},
}};

} // namespace

const char* error_kind_name(ErrorKind kind) noexcept {
    for (const auto& [value, name] : kNames) {
        if (value == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<ErrorKind> parse_error_kind(const std::string& name) noexcept {
    for (const auto& [value, text] : kNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

std::string Error::to_string() const {
    std::string out = error_kind_name(kind);
    out += ": ";
    out += message;
    if (!path.empty()) {
        out += " [" + path + "]";
    }
    return out;
}

} // namespace ferry
