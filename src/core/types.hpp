#pragma once

#include <string>
#include <utility>

// Failure categories surfaced by the lock manager and the client factory.
// Callers map these to process exit codes.
enum class ErrorKind {
    None,
    LockIO,             // lock file unreadable/unwritable for reasons other than absence
    LockContention,     // another live instance keeps the lock
    KillFailure,        // termination request to the competing owner failed
    CertificateParse,   // trust anchor or peer certificate malformed
    Verification,       // no reference time produced a valid chain
    Config,             // configuration or TLS context could not be built
    Transport           // connect / handshake / HTTP framing failure
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Config};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Config};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct LockConfig {
    std::string dir;                    // empty = system temp dir
    std::string file_name;
    bool kill_existing = true;
    int kill_poll_attempts = 10;
    int kill_poll_interval_ms = 100;
    bool reclaim_unconfirmed = true;    // reclaim even if the old owner outlives the poll
};

struct TlsConfig {
    int clock_skew_hours = 24;
    std::string min_version = "1.2";    // "1.2" or "1.3"
    int timeout_secs = 30;
};

struct LogConfig {
    std::string path;                   // empty = <temp>/mcpcore_debug.log
    std::string level = "info";
};

