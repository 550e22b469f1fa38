#include "instance_lock.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  include <io.h>
#  include <fcntl.h>
#  include <sys/stat.h>
#else
#  include <unistd.h>
#  include <fcntl.h>
#endif

static const char* kTag = "lock";

// ── Options ────────────────────────────────────────────────────

LockOptions::LockOptions()
    : kill_poll_attempts(KILL_POLL_ATTEMPTS),
      kill_poll_interval_ms(KILL_POLL_INTERVAL_MS),
      claim_max_attempts(LOCK_CLAIM_MAX_ATTEMPTS),
      claim_backoff_ms(LOCK_CLAIM_BACKOFF_MS) {}

LockOptions::LockOptions(fs::path lock_path) : LockOptions() {
    path = std::move(lock_path);
}

LockOptions LockOptions::from_config(const Config& config) {
    LockOptions opts(config.lock_file_path());
    opts.kill_poll_attempts = config.lock().kill_poll_attempts;
    opts.kill_poll_interval_ms = config.lock().kill_poll_interval_ms;
    opts.reclaim_unconfirmed = config.lock().reclaim_unconfirmed;
    return opts;
}

// ── InstanceLock ───────────────────────────────────────────────

InstanceLock::InstanceLock(LockOptions options, platform::ProcessControl& processes)
    : options_(std::move(options)),
      processes_(processes),
      pid_(processes.current_pid()) {}

Result<LockStatus> InstanceLock::acquire(bool kill_existing) {
    int backoff = options_.claim_backoff_ms;
    int attempts = options_.claim_max_attempts > 0 ? options_.claim_max_attempts : 1;

    for (int i = 0; i < attempts; i++) {
        bool lost_race = false;
        auto result = attempt(kill_existing, lost_race);
        if (!lost_race) return result;

        log_debug(kTag, fmt::format("{} changed while claiming (attempt {}/{}), re-inspecting",
                                    options_.path.string(), i + 1, attempts));
        if (i + 1 < attempts) {
            platform::sleep_ms(backoff);
            backoff *= 2;
        }
    }

    return Result<LockStatus>::Err(ErrorKind::LockContention,
        fmt::format("lock file {} kept being claimed by another process ({} attempts)",
                    options_.path.string(), attempts));
}

Result<LockStatus> InstanceLock::attempt(bool kill_existing, bool& lost_race) {
    std::error_code ec;
    bool exists = fs::exists(options_.path, ec);
    if (ec) {
        return Result<LockStatus>::Err(ErrorKind::LockIO,
            fmt::format("cannot inspect lock file {}: {}", options_.path.string(), ec.message()));
    }

    if (exists) {
        auto content = read_record();
        std::optional<int> owner;
        if (content) owner = parse_int(*content);

        if (!content) {
            log_debug(kTag, "lock file unreadable, treating as stale");
        } else if (!owner) {
            log_debug(kTag, fmt::format("lock file holds '{}', not a PID; treating as stale", *content));
        }

        if (owner && *owner == pid_) {
            return Result<LockStatus>::Ok(LockStatus::Acquired);
        }

        if (owner && processes_.is_running(*owner)) {
            if (!kill_existing) {
                log_info(kTag, fmt::format("instance PID {} is running; not taking the lock", *owner));
                return Result<LockStatus>::Ok(LockStatus::Rejected);
            }

            std::string kill_error;
            auto outcome = terminate_owner(*owner, kill_error);
            last_termination_ = outcome;

            switch (outcome) {
                case TerminationOutcome::KillFailed:
                    log_error(kTag, fmt::format("kill PID {} failed: {}", *owner, kill_error));
                    return Result<LockStatus>::Err(ErrorKind::KillFailure,
                        fmt::format("failed to kill existing instance (PID {}): {}", *owner, kill_error));
                case TerminationOutcome::Unconfirmed:
                    if (!options_.reclaim_unconfirmed) {
                        return Result<LockStatus>::Err(ErrorKind::LockContention,
                            fmt::format("existing instance (PID {}) still running after {} checks",
                                        *owner, options_.kill_poll_attempts));
                    }
                    log_warn(kTag, fmt::format("PID {} still alive after kill; reclaiming lock anyway", *owner));
                    break;
                case TerminationOutcome::ConfirmedDead:
                    log_info(kTag, fmt::format("terminated previous instance PID {}", *owner));
                    break;
            }
        } else if (owner) {
            log_debug(kTag, fmt::format("lock owner PID {} is gone; removing stale lock", *owner));
        }

        auto removed = remove_record(content);
        if (removed.is_err()) {
            return Result<LockStatus>::Err(removed.kind, removed.error);
        }
        if (!removed.value) {
            lost_race = true;
            return Result<LockStatus>::Err(ErrorKind::LockContention, "lock file replaced during inspection");
        }
    }

    auto claimed = claim();
    if (claimed.is_err()) {
        return Result<LockStatus>::Err(claimed.kind, claimed.error);
    }
    if (!claimed.value) {
        lost_race = true;
        return Result<LockStatus>::Err(ErrorKind::LockContention, "lost race for lock file");
    }

    log_info(kTag, fmt::format("acquired {} as PID {}", options_.path.string(), pid_));
    return Result<LockStatus>::Ok(LockStatus::Acquired);
}

TerminationOutcome InstanceLock::terminate_owner(int owner, std::string& error) {
    auto killed = processes_.terminate(owner);
    if (killed.is_err()) {
        error = killed.error;
        return TerminationOutcome::KillFailed;
    }

    for (int i = 0; i < options_.kill_poll_attempts; i++) {
        if (!processes_.is_running(owner)) {
            return TerminationOutcome::ConfirmedDead;
        }
        platform::sleep_ms(options_.kill_poll_interval_ms);
    }
    return processes_.is_running(owner) ? TerminationOutcome::Unconfirmed
                                        : TerminationOutcome::ConfirmedDead;
}

static std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return content;
}

std::optional<std::string> InstanceLock::read_record() const {
    return read_file(options_.path);
}

// The record is moved aside before it is deleted, so only the exact record
// that was inspected is ever removed. A record that turns out to be newer is
// linked back into place (never over a file that appeared meanwhile).
Result<bool> InstanceLock::remove_record(const std::optional<std::string>& inspected) {
    fs::path aside = options_.path;
    aside += fmt::format(".{}.stale", pid_);

    std::error_code ec;
    fs::rename(options_.path, aside, ec);
    if (ec == std::errc::no_such_file_or_directory) {
        return Result<bool>::Ok(true);
    }
    if (ec) {
        return Result<bool>::Err(ErrorKind::LockIO,
            fmt::format("cannot remove lock file {}: {}", options_.path.string(), ec.message()));
    }

    if (read_file(aside) != inspected) {
        fs::create_hard_link(aside, options_.path, ec);
        std::error_code cleanup;
        fs::remove(aside, cleanup);
        if (ec && ec != std::errc::file_exists) {
            return Result<bool>::Err(ErrorKind::LockIO,
                fmt::format("cannot restore lock file {}: {}", options_.path.string(), ec.message()));
        }
        log_debug(kTag, "lock file was replaced after inspection; left in place");
        return Result<bool>::Ok(false);
    }

    fs::remove(aside, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Result<bool>::Err(ErrorKind::LockIO,
            fmt::format("cannot remove lock file {}: {}", aside.string(), ec.message()));
    }
    return Result<bool>::Ok(true);
}

Result<bool> InstanceLock::claim() {
    const std::string path = options_.path.string();
    const std::string content = std::to_string(pid_);

#ifdef _WIN32
    int fd = _open(path.c_str(), _O_CREAT | _O_EXCL | _O_WRONLY | _O_BINARY, _S_IREAD | _S_IWRITE);
#else
    int fd = open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
#endif
    if (fd < 0) {
        if (errno == EEXIST) return Result<bool>::Ok(false);
        return Result<bool>::Err(ErrorKind::LockIO,
            fmt::format("failed to create lock file {}: {}", path, strerror(errno)));
    }

#ifdef _WIN32
    int written = _write(fd, content.data(), static_cast<unsigned>(content.size()));
    int close_ret = _close(fd);
#else
    ssize_t written = write(fd, content.data(), content.size());
    int close_ret = close(fd);
#endif
    if (written != static_cast<decltype(written)>(content.size()) || close_ret != 0) {
        int err = errno;
        std::error_code ec;
        fs::remove(options_.path, ec);
        return Result<bool>::Err(ErrorKind::LockIO,
            fmt::format("failed to write lock file {}: {}", path, strerror(err)));
    }
    return Result<bool>::Ok(true);
}

Result<void> InstanceLock::release() {
    std::error_code ec;
    if (!fs::exists(options_.path, ec)) {
        return Result<void>::Err(ErrorKind::LockIO,
            fmt::format("cannot remove lock file {}: {}", options_.path.string(),
                        ec ? ec.message() : "no such file"));
    }

    // Never delete a record that a newer instance has taken over
    if (auto content = read_record()) {
        auto owner = parse_int(*content);
        if (owner && *owner != pid_ && processes_.is_running(*owner)) {
            return Result<void>::Err(ErrorKind::LockIO,
                fmt::format("lock file {} is owned by PID {}", options_.path.string(), *owner));
        }
    }

    if (!fs::remove(options_.path, ec) || ec) {
        return Result<void>::Err(ErrorKind::LockIO,
            fmt::format("cannot remove lock file {}: {}", options_.path.string(),
                        ec ? ec.message() : "no such file"));
    }
    log_info(kTag, fmt::format("released {}", options_.path.string()));
    return Result<void>::Ok();
}

// ── LockGuard ──────────────────────────────────────────────────

LockGuard::~LockGuard() {
    if (!lock_) return;
    auto released = lock_->release();
    if (released.is_err()) {
        log_warn(kTag, fmt::format("failed to release instance lock on exit: {}", released.error));
    }
}
