#pragma once

#include <optional>
#include <string>

namespace ferry {

/**
 * @brief Failure taxonomy shared by every engine component
 *
 * The first five kinds are the transfer error classes; the rest describe
 * terminal causes (rejection, cancellation) and local misuse.
 */
enum class ErrorKind {
    Manifest,   ///< scan or checksum failure, invalid manifest
    Transport,  ///< connectivity or protocol negotiation failure
    Storage,    ///< disk space, permission, I/O
    Integrity,  ///< chunk or file checksum mismatch
    Resume,     ///< invalid, unknown or expired resume token
    Rejected,   ///< peer refused the transfer
    Cancelled,  ///< cooperative cancellation
    Queue,      ///< invalid queue operation or unknown item
    Config,     ///< invalid configuration
    Protocol,   ///< malformed wire frame
    State       ///< operation not valid in the current session or item state
};

const char* error_kind_name(ErrorKind kind) noexcept;
std::optional<ErrorKind> parse_error_kind(const std::string& name) noexcept;

struct Error {
    ErrorKind kind = ErrorKind::Transport;
    std::string message;
    std::string path; ///< Offending file or directory, when there is one

    Error() = default;
    Error(ErrorKind k, std::string msg, std::string p = {})
        : kind(k), message(std::move(msg)), path(std::move(p)) {}

    static Error manifest(std::string msg, std::string p = {}) { return {ErrorKind::Manifest, std::move(msg), std::move(p)}; }
    static Error transport(std::string msg) { return {ErrorKind::Transport, std::move(msg)}; }
    static Error storage(std::string msg, std::string p = {}) { return {ErrorKind::Storage, std::move(msg), std::move(p)}; }
    static Error integrity(std::string msg, std::string p = {}) { return {ErrorKind::Integrity, std::move(msg), std::move(p)}; }
    static Error resume(std::string msg, std::string p = {}) { return {ErrorKind::Resume, std::move(msg), std::move(p)}; }
    static Error rejected(std::string msg) { return {ErrorKind::Rejected, std::move(msg)}; }
    static Error cancelled(std::string msg = "cancelled") { return {ErrorKind::Cancelled, std::move(msg)}; }
    static Error queue(std::string msg) { return {ErrorKind::Queue, std::move(msg)}; }
    static Error config(std::string msg, std::string p = {}) { return {ErrorKind::Config, std::move(msg), std::move(p)}; }
    static Error protocol(std::string msg) { return {ErrorKind::Protocol, std::move(msg)}; }
    static Error state(std::string msg) { return {ErrorKind::State, std::move(msg)}; }

    /// Transport and chunk-level integrity failures can be retried locally.
    bool recoverable() const noexcept {
        return kind == ErrorKind::Transport || kind == ErrorKind::Integrity;
    }

    bool should_fallback() const noexcept { return kind == ErrorKind::Transport; }

    std::string to_string() const;
};

} // namespace ferry
