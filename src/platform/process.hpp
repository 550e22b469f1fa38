#pragma once

#include <core/types.hpp>

namespace platform {

// Process identity, liveness and termination by numeric PID.
// The lock manager only talks to processes through this interface so that
// tests can substitute a fake instead of signalling real processes.
class ProcessControl {
public:
    virtual ~ProcessControl() = default;

    virtual int current_pid() const = 0;

    // True if a process with this PID exists and has not exited.
    // Zombies (exited, not yet reaped) count as not running.
    virtual bool is_running(int pid) const = 0;

    // Request immediate termination (SIGKILL / TerminateProcess).
    // Does not wait for the process to go away.
    virtual Result<void> terminate(int pid) = 0;
};

class SystemProcessControl : public ProcessControl {
public:
    int current_pid() const override;
    bool is_running(int pid) const override;
    Result<void> terminate(int pid) override;
};

} // namespace platform
