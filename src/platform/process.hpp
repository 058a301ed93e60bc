#pragma once

#include <string>
#include <vector>
#include <map>

namespace platform {

// Spawn a child detached into its own session/process group so that an
// interrupt delivered to the invoking terminal does not reach it. stdin and
// stdout are attached to /dev/null. stderr_log: if non-empty, the child's
// stderr is appended to this file, else it goes to /dev/null too.
// Does not wait. Returns the pid, or -1 if fork failed.
int spawn_detached(const std::string& program,
                   const std::vector<std::string>& args,
                   const std::string& stderr_log = "");

// Zero-signal liveness probe. A zombie child of this process is reaped and
// reported dead. "No such process" means dead; a permission error means alive.
bool process_exists(int pid);

// Send SIGTERM. ESRCH is treated as already terminated. If pid is our own
// child, wait up to grace_ms for it to exit, then SIGKILL and reap it.
void terminate_process(int pid, int grace_ms);

// Run a program in the foreground with extra environment variables and
// return its exit status (128 + signal if killed, 127 if exec failed).
int run_foreground(const std::string& program,
                   const std::vector<std::string>& args,
                   const std::map<std::string, std::string>& env = {});

} // namespace platform

// Seam between the tunnel manager and the OS process table.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Start argv[0] with argv[1..] without waiting for it. Returns the pid.
    virtual int spawn(const std::vector<std::string>& argv) = 0;
    virtual bool is_alive(int pid) = 0;
    virtual void terminate(int pid) = 0;
};

// ProcessLauncher backed by fork/exec and kill(2).
class SystemProcessLauncher : public ProcessLauncher {
public:
    explicit SystemProcessLauncher(std::string stderr_log = "");

    int spawn(const std::vector<std::string>& argv) override;
    bool is_alive(int pid) override;
    void terminate(int pid) override;

private:
    std::string stderr_log_;
};
