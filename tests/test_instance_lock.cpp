#include <gtest/gtest.h>
#include <managers/instance_lock.hpp>
#include <core/constants.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <set>

namespace fs = std::filesystem;

// Scripted process table: no real signals are sent.
class FakeProcesses : public platform::ProcessControl {
public:
    int self = 4242;
    std::set<int> alive;
    std::vector<int> killed;
    bool kill_fails = false;
    bool survives_kill = false;
    int checks_until_death = 0;     // is_running() calls after the kill that still report alive
    std::function<void(int)> on_check;   // runs at the start of every is_running()

    int current_pid() const override { return self; }

    bool is_running(int pid) const override {
        if (on_check) on_check(pid);
        auto it = dying_.find(pid);
        if (it != dying_.end()) {
            if (it->second == 0) return false;
            it->second--;
            return true;
        }
        return alive.count(pid) > 0;
    }

    Result<void> terminate(int pid) override {
        killed.push_back(pid);
        if (kill_fails) {
            return Result<void>::Err(ErrorKind::KillFailure, "operation not permitted");
        }
        if (!survives_kill) dying_[pid] = checks_until_death;
        return Result<void>::Ok();
    }

private:
    mutable std::map<int, int> dying_;
};

class InstanceLockTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path lock_path;
    FakeProcesses procs;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "mcpcore_lock_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        lock_path = test_dir / "matlab-mcp-core-server.lock";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    LockOptions options() const {
        LockOptions opts(lock_path);
        opts.kill_poll_interval_ms = 10;
        return opts;
    }

    void write_lock(const std::string& content) {
        std::ofstream(lock_path, std::ios::binary) << content;
    }

    std::string read_lock() const {
        std::ifstream in(lock_path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
};

TEST_F(InstanceLockTest, AcquiresWhenNoLockFile) {
    InstanceLock lock(options(), procs);

    auto result = lock.acquire(true);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, LockStatus::Acquired);
    EXPECT_EQ(read_lock(), "4242");
    EXPECT_TRUE(procs.killed.empty());
}

TEST_F(InstanceLockTest, ReplacesRecordOfDeadProcess) {
    write_lock("99999");
    InstanceLock lock(options(), procs);

    auto result = lock.acquire(false);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, LockStatus::Acquired);
    EXPECT_EQ(read_lock(), "4242");
    EXPECT_TRUE(procs.killed.empty());
}

TEST_F(InstanceLockTest, RejectsLiveOwnerWithoutKill) {
    write_lock("1234");
    procs.alive.insert(1234);
    InstanceLock lock(options(), procs);

    auto result = lock.try_lock();
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, LockStatus::Rejected);
    EXPECT_EQ(read_lock(), "1234");
    EXPECT_TRUE(procs.killed.empty());
}

TEST_F(InstanceLockTest, KillsLiveOwnerAndTakesOver) {
    write_lock("1234");
    procs.alive.insert(1234);
    procs.checks_until_death = 2;
    LockOptions opts(lock_path);    // default 10 x 100ms poll
    InstanceLock lock(opts, procs);

    auto start = std::chrono::steady_clock::now();
    auto result = lock.acquire(true);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, LockStatus::Acquired);
    EXPECT_EQ(read_lock(), "4242");
    ASSERT_EQ(procs.killed.size(), 1u);
    EXPECT_EQ(procs.killed[0], 1234);
    ASSERT_TRUE(lock.last_termination().has_value());
    EXPECT_EQ(*lock.last_termination(), TerminationOutcome::ConfirmedDead);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST_F(InstanceLockTest, KillFailureIsReported) {
    write_lock("1234");
    procs.alive.insert(1234);
    procs.kill_fails = true;
    InstanceLock lock(options(), procs);

    auto result = lock.acquire(true);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.kind, ErrorKind::KillFailure);
    EXPECT_NE(result.error.find("PID 1234"), std::string::npos);
    EXPECT_EQ(read_lock(), "1234");
    EXPECT_EQ(*lock.last_termination(), TerminationOutcome::KillFailed);
}

TEST_F(InstanceLockTest, UnconfirmedDeathReclaimedByDefault) {
    write_lock("1234");
    procs.alive.insert(1234);
    procs.survives_kill = true;
    InstanceLock lock(options(), procs);

    auto result = lock.acquire(true);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, LockStatus::Acquired);
    EXPECT_EQ(read_lock(), "4242");
    EXPECT_EQ(*lock.last_termination(), TerminationOutcome::Unconfirmed);
}

TEST_F(InstanceLockTest, UnconfirmedDeathWithoutReclaimIsContention) {
    write_lock("1234");
    procs.alive.insert(1234);
    procs.survives_kill = true;
    LockOptions opts = options();
    opts.reclaim_unconfirmed = false;
    InstanceLock lock(opts, procs);

    auto result = lock.acquire(true);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.kind, ErrorKind::LockContention);
    EXPECT_EQ(read_lock(), "1234");
}

TEST_F(InstanceLockTest, GarbageContentIsStale) {
    write_lock("not-a-pid\n");
    InstanceLock lock(options(), procs);

    auto result = lock.acquire(false);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, LockStatus::Acquired);
    EXPECT_EQ(read_lock(), "4242");
}

TEST_F(InstanceLockTest, EmptyFileIsStale) {
    write_lock("");
    InstanceLock lock(options(), procs);

    auto result = lock.acquire(false);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, LockStatus::Acquired);
}

TEST_F(InstanceLockTest, PidWithWhitespaceIsAccepted) {
    write_lock(" 1234\n");
    procs.alive.insert(1234);
    InstanceLock lock(options(), procs);

    auto result = lock.try_lock();
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, LockStatus::Rejected);
}

TEST_F(InstanceLockTest, AcquireIsIdempotent) {
    InstanceLock lock(options(), procs);

    ASSERT_TRUE(lock.acquire(true).is_ok());
    auto before = fs::last_write_time(lock_path);

    auto again = lock.acquire(true);
    ASSERT_TRUE(again.is_ok()) << again.error;
    EXPECT_EQ(again.value, LockStatus::Acquired);
    EXPECT_EQ(read_lock(), "4242");
    EXPECT_TRUE(fs::last_write_time(lock_path) == before);
    EXPECT_TRUE(procs.killed.empty());
}

TEST_F(InstanceLockTest, CompetitorClaimDuringInspectionIsKept) {
    write_lock("99999");

    FakeProcesses other_procs;
    other_procs.self = 2222;
    InstanceLock other(options(), other_procs);
    Result<LockStatus> other_result = Result<LockStatus>::Err(ErrorKind::None, "not run");

    // While we ask whether 99999 lives, the competitor takes the lock
    bool fired = false;
    procs.on_check = [&](int pid) {
        if (pid != 99999 || fired) return;
        fired = true;
        other_result = other.acquire(false);
    };
    procs.alive.insert(2222);
    InstanceLock lock(options(), procs);

    auto result = lock.acquire(false);
    ASSERT_TRUE(other_result.is_ok()) << other_result.error;
    EXPECT_EQ(other_result.value, LockStatus::Acquired);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, LockStatus::Rejected);
    EXPECT_EQ(read_lock(), "2222");
    EXPECT_FALSE(fs::exists(lock_path.string() + ".4242.stale"));
}

TEST_F(InstanceLockTest, RecordReplacedOnceIsReinspected) {
    write_lock("99999");
    int checks = 0;
    procs.on_check = [&](int pid) {
        checks++;
        if (pid == 99999) write_lock("99998");     // another stale record
    };
    InstanceLock lock(options(), procs);

    auto start = std::chrono::steady_clock::now();
    auto result = lock.acquire(false);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, LockStatus::Acquired);
    EXPECT_EQ(read_lock(), "4242");
    EXPECT_EQ(checks, 2);
    EXPECT_GE(elapsed, std::chrono::milliseconds(LOCK_CLAIM_BACKOFF_MS));
}

TEST_F(InstanceLockTest, RecordReplacedEveryTimeIsContention) {
    write_lock("10001");
    int checks = 0;
    procs.on_check = [&](int pid) {
        checks++;
        write_lock(std::to_string(pid + 1));
    };
    LockOptions opts = options();
    opts.claim_max_attempts = 3;
    opts.claim_backoff_ms = 20;
    InstanceLock lock(opts, procs);

    auto start = std::chrono::steady_clock::now();
    auto result = lock.acquire(false);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.kind, ErrorKind::LockContention);
    EXPECT_EQ(checks, 3);
    EXPECT_EQ(read_lock(), "10004");
    // 20ms then 40ms between the three attempts
    EXPECT_GE(elapsed, std::chrono::milliseconds(60));
}

TEST_F(InstanceLockTest, ReleaseRemovesFileOnce) {
    InstanceLock lock(options(), procs);
    ASSERT_TRUE(lock.acquire(true).is_ok());

    auto first = lock.release();
    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_FALSE(fs::exists(lock_path));

    auto second = lock.release();
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.kind, ErrorKind::LockIO);
}

TEST_F(InstanceLockTest, ReleaseLeavesNewerOwnersRecord) {
    InstanceLock lock(options(), procs);
    ASSERT_TRUE(lock.acquire(true).is_ok());

    write_lock("5555");
    procs.alive.insert(5555);

    auto released = lock.release();
    ASSERT_TRUE(released.is_err());
    EXPECT_EQ(released.kind, ErrorKind::LockIO);
    EXPECT_EQ(read_lock(), "5555");
}

TEST_F(InstanceLockTest, MissingDirectoryIsLockIO) {
    LockOptions opts(test_dir / "missing" / "x.lock");
    InstanceLock lock(opts, procs);

    auto result = lock.acquire(true);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.kind, ErrorKind::LockIO);
}

TEST_F(InstanceLockTest, GuardReleasesOnScopeExit) {
    InstanceLock lock(options(), procs);
    ASSERT_TRUE(lock.acquire(true).is_ok());
    {
        LockGuard guard(lock);
        EXPECT_TRUE(fs::exists(lock_path));
    }
    EXPECT_FALSE(fs::exists(lock_path));
}

TEST_F(InstanceLockTest, DismissedGuardKeepsLock) {
    InstanceLock lock(options(), procs);
    ASSERT_TRUE(lock.acquire(true).is_ok());
    {
        LockGuard guard(lock);
        guard.dismiss();
    }
    EXPECT_TRUE(fs::exists(lock_path));
}

TEST_F(InstanceLockTest, OptionsFromConfig) {
    auto config = Config::parse(
        "lock:\n"
        "  dir: \"" + test_dir.generic_string() + "\"\n"
        "  file_name: other.lock\n"
        "  kill_poll_attempts: 3\n"
        "  kill_poll_interval_ms: 5\n"
        "  reclaim_unconfirmed: false\n");
    ASSERT_TRUE(config.is_ok()) << config.error;

    auto opts = LockOptions::from_config(config.value);
    EXPECT_EQ(opts.path.string(), (test_dir / "other.lock").string());
    EXPECT_EQ(opts.kill_poll_attempts, 3);
    EXPECT_EQ(opts.kill_poll_interval_ms, 5);
    EXPECT_FALSE(opts.reclaim_unconfirmed);
}
