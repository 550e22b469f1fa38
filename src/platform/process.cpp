#include "process.hpp"
#include "platform.hpp"
#include <fmt/format.h>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <unistd.h>
#  include <signal.h>
#  include <cerrno>
#  include <cstring>
#  include <fstream>
#endif

namespace platform {

// ── SystemProcessControl ─────────────────────────────────────

int SystemProcessControl::current_pid() const {
    return platform::current_pid();
}

#ifdef _WIN32

bool SystemProcessControl::is_running(int pid) const {
    if (pid <= 0) return false;
    HANDLE h = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (!h) {
        // Exists but we may not query it
        return GetLastError() == ERROR_ACCESS_DENIED;
    }
    DWORD code = 0;
    bool alive = GetExitCodeProcess(h, &code) && code == STILL_ACTIVE;
    CloseHandle(h);
    return alive;
}

Result<void> SystemProcessControl::terminate(int pid) {
    if (pid <= 0) {
        return Result<void>::Err(ErrorKind::KillFailure, fmt::format("invalid PID {}", pid));
    }
    HANDLE h = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(pid));
    if (!h) {
        return Result<void>::Err(ErrorKind::KillFailure,
            fmt::format("OpenProcess({}) failed (error {})", pid, GetLastError()));
    }
    BOOL ok = TerminateProcess(h, 1);
    DWORD err = GetLastError();
    CloseHandle(h);
    if (!ok) {
        return Result<void>::Err(ErrorKind::KillFailure,
            fmt::format("TerminateProcess({}) failed (error {})", pid, err));
    }
    return Result<void>::Ok();
}

#else // Unix

// /proc/<pid>/stat: "pid (comm) state ..."; comm may contain spaces and
// parens, so the state follows the last ')'.
static char proc_state(int pid) {
    std::ifstream file("/proc/" + std::to_string(pid) + "/stat");
    if (!file) return '\0';

    std::string content;
    std::getline(file, content);
    size_t comm_end = content.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 >= content.size()) return '\0';
    return content[comm_end + 2];
}

static std::string kill_error_message(int pid, int err) {
    switch (err) {
        case EPERM:
            return fmt::format("permission denied signalling PID {}", pid);
        case ESRCH:
            return fmt::format("PID {} not found (already exited)", pid);
        default:
            return fmt::format("kill({}) failed: {} (errno {})", pid, strerror(err), err);
    }
}

bool SystemProcessControl::is_running(int pid) const {
    if (pid <= 0) return false;

    // EPERM means the process exists but belongs to someone else
    if (kill(pid, 0) != 0 && errno != EPERM) return false;

    char state = proc_state(pid);
    if (state == 'Z' || state == 'X') return false;
    return true;
}

Result<void> SystemProcessControl::terminate(int pid) {
    if (pid <= 0) {
        return Result<void>::Err(ErrorKind::KillFailure, fmt::format("invalid PID {}", pid));
    }
    if (kill(pid, SIGKILL) == -1) {
        return Result<void>::Err(ErrorKind::KillFailure, kill_error_message(pid, errno));
    }
    return Result<void>::Ok();
}

#endif

} // namespace platform
