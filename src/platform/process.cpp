#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <stdexcept>
#include <fmt/format.h>

namespace platform {

static std::vector<const char*> build_argv(const std::string& program,
                                           const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    return argv;
}

int spawn_detached(const std::string& program,
                   const std::vector<std::string>& args,
                   const std::string& stderr_log) {
    // Build before fork: no allocation in the child.
    auto argv = build_argv(program, args);

    pid_t pid = fork();
    if (pid < 0) return -1;

    if (pid == 0) {
        // Child process: new session, detached from the controlling terminal.
        setsid();

        // No standard stream stays attached to the caller's terminal or pipes.
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }

        if (!stderr_log.empty()) {
            int fd = open(stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }
        if (devnull > STDERR_FILENO) close(devnull);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    return pid;
}

bool process_exists(int pid) {
    if (pid <= 0) return false;

    // Reap our own exited child first; kill(pid, 0) succeeds on zombies.
    int status;
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid) return false;

    if (kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

void terminate_process(int pid, int grace_ms) {
    if (pid <= 0) return;
    if (kill(pid, SIGTERM) != 0) {
        // ESRCH: already gone. EPERM: not ours to signal, nothing more to do.
        return;
    }

    // Only our own children can be reaped; for anything else waitpid fails
    // with ECHILD and the signal alone has to do.
    for (int waited = 0; waited < grace_ms; waited += 100) {
        int status;
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) return;
        if (ret < 0) return;
        sleep_ms(100);
    }
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

int run_foreground(const std::string& program,
                   const std::vector<std::string>& args,
                   const std::map<std::string, std::string>& env) {
    auto argv = build_argv(program, args);

    pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error(fmt::format("fork() failed for '{}'", program));
    }

    if (pid == 0) {
        for (const auto& [key, value] : env) {
            setenv(key.c_str(), value.c_str(), 1);
        }
        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace platform

// ── SystemProcessLauncher ────────────────────────────────────

SystemProcessLauncher::SystemProcessLauncher(std::string stderr_log)
    : stderr_log_(std::move(stderr_log)) {}

int SystemProcessLauncher::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("spawn: empty argument vector");
    }
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    int pid = platform::spawn_detached(argv[0], args, stderr_log_);
    if (pid < 0) {
        throw std::runtime_error(fmt::format("fork() failed while starting '{}'", argv[0]));
    }
    return pid;
}

bool SystemProcessLauncher::is_alive(int pid) {
    return platform::process_exists(pid);
}

void SystemProcessLauncher::terminate(int pid) {
    platform::terminate_process(pid, TERMINATE_GRACE_MS);
}
