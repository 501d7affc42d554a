#pragma once

#include <string>

namespace vellum {

/**
 * ErrorKind - What went wrong, independent of where.
 *
 * Per-envelope kinds (Authentication, Format) are isolated by the sync
 * engine; cycle-level kinds (ServerUnreachable, Derivation) abort a cycle.
 */
enum class ErrorKind {
    Internal,
    InvalidArgument,
    EntropySource,
    Derivation,
    Authentication,
    Format,
    ServerUnreachable,
    Transport,
    Rejected,
    Storage,
    Busy,
    Conflict,
    Cancelled
};

[[nodiscard]] constexpr const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Internal: return "internal";
        case ErrorKind::InvalidArgument: return "invalid-argument";
        case ErrorKind::EntropySource: return "entropy-source";
        case ErrorKind::Derivation: return "derivation";
        case ErrorKind::Authentication: return "authentication";
        case ErrorKind::Format: return "format";
        case ErrorKind::ServerUnreachable: return "server-unreachable";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Rejected: return "rejected";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::Busy: return "busy";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * Error type for Result - a kind, a message and an optional numeric code
 * (SQLite result code, HTTP status).
 */
struct Error {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;
    int code{0};

    Error() = default;
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}
    explicit Error(std::string msg, int c = 0)
        : message(std::move(msg)), code(c) {}

    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }

    [[nodiscard]] std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message && code == other.code;
    }
};

} // namespace vellum
