#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include <platform/process.hpp>

namespace fs = std::filesystem;

enum class LockStatus {
    Acquired,
    Rejected    // another live instance holds the lock and we were told not to kill it
};

enum class TerminationOutcome {
    ConfirmedDead,  // observed gone within the poll budget
    Unconfirmed,    // still alive after the poll budget
    KillFailed      // the kill request itself failed
};

struct LockOptions {
    fs::path path;
    int kill_poll_attempts;
    int kill_poll_interval_ms;
    bool reclaim_unconfirmed = true;
    int claim_max_attempts;
    int claim_backoff_ms;

    LockOptions();
    explicit LockOptions(fs::path lock_path);

    static LockOptions from_config(const Config& config);
};

// InstanceLock: one live instance per host, recorded in a PID lock file.
//
// The lock file holds the owner's PID as decimal text and nothing else.
// A record whose PID is unreadable, unparsable or not running is stale and
// is replaced silently. A live owner is either left alone (Rejected) or
// killed and replaced, depending on kill_existing.
//
// A stale record is moved aside and checked before it is deleted, so a
// record written by a competitor after our inspection is put back rather
// than destroyed. Claims use an exclusive create. Either kind of lost race
// restarts the inspection, a bounded number of times. The guarantee is
// between two racing processes; with three or more, a record restored by
// one can still be displaced by a third claimant's exclusive create.
// No handle is held between calls; the path is re-examined on every attempt.
class InstanceLock {
public:
    InstanceLock(LockOptions options, platform::ProcessControl& processes);

    Result<LockStatus> acquire(bool kill_existing);
    Result<LockStatus> try_lock() { return acquire(false); }

    // Remove the lock file. Fails with LockIO if it is missing, cannot be
    // removed, or now names another live process.
    Result<void> release();

    const fs::path& path() const { return options_.path; }
    int pid() const { return pid_; }

    // Outcome of the most recent termination attempt, if any.
    std::optional<TerminationOutcome> last_termination() const { return last_termination_; }

private:
    Result<LockStatus> attempt(bool kill_existing, bool& lost_race);
    TerminationOutcome terminate_owner(int owner, std::string& error);

    std::optional<std::string> read_record() const;

    // Ok(true) = the inspected record is gone, Ok(false) = a different
    // record had replaced it and was left in place.
    Result<bool> remove_record(const std::optional<std::string>& inspected);

    // Ok(true) = created and written, Ok(false) = file appeared first.
    Result<bool> claim();

    LockOptions options_;
    platform::ProcessControl& processes_;
    int pid_;
    std::optional<TerminationOutcome> last_termination_;
};

// Releases the lock when it goes out of scope; a failed release is logged.
class LockGuard {
public:
    explicit LockGuard(InstanceLock& lock) : lock_(&lock) {}
    ~LockGuard();

    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

    void dismiss() { lock_ = nullptr; }

private:
    InstanceLock* lock_;
};
