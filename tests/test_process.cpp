#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <cstdio>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>

namespace fs = std::filesystem;

// Poll process_exists until it reports the pid gone, for at most timeout_ms.
static bool wait_until_gone(int pid, int timeout_ms) {
    for (int waited = 0; waited < timeout_ms; waited += 20) {
        if (!platform::process_exists(pid)) return true;
        platform::sleep_ms(20);
    }
    return !platform::process_exists(pid);
}

TEST(Process, SpawnRunsInOwnSession) {
    int pid = platform::spawn_detached("sleep", {"5"});
    ASSERT_GT(pid, 0);
    EXPECT_TRUE(platform::process_exists(pid));
    EXPECT_EQ(getsid(pid), pid);

    platform::terminate_process(pid, 2000);
    EXPECT_FALSE(platform::process_exists(pid));
}

TEST(Process, SpawnDoesNotHoldCallerStdout) {
    int fds[2];
    ASSERT_EQ(pipe2(fds, O_CLOEXEC), 0);

    std::fflush(stdout);
    int saved = fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 0);
    ASSERT_GE(saved, 0);
    dup2(fds[1], STDOUT_FILENO);

    int pid = platform::spawn_detached("sleep", {"5"});

    dup2(saved, STDOUT_FILENO);
    close(saved);
    close(fds[1]);
    ASSERT_GT(pid, 0);

    // With every writer gone the read end reports EOF at once, while the
    // child is still running.
    struct pollfd pfd = {fds[0], POLLIN, 0};
    int ready = poll(&pfd, 1, 1000);
    EXPECT_EQ(ready, 1);
    if (ready == 1) {
        char c;
        EXPECT_EQ(read(fds[0], &c, 1), 0);
    }
    EXPECT_TRUE(platform::process_exists(pid));

    close(fds[0]);
    platform::terminate_process(pid, 2000);
}

TEST(Process, StderrGoesToLog) {
    fs::path log = fs::temp_directory_path() / "ktun_process_test_stderr.log";
    fs::remove(log);

    int pid = platform::spawn_detached("sh", {"-c", "echo oops >&2"}, log.string());
    ASSERT_GT(pid, 0);
    EXPECT_TRUE(wait_until_gone(pid, 2000));

    std::ifstream in(log);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find("oops"), std::string::npos);
    fs::remove(log);
}

TEST(Process, ExitedChildIsReapedAndReportedDead) {
    int pid = platform::spawn_detached("true", {});
    ASSERT_GT(pid, 0);

    // The zombie counts as dead and is reaped by the check itself.
    EXPECT_TRUE(wait_until_gone(pid, 2000));
    errno = 0;
    EXPECT_EQ(waitpid(pid, nullptr, WNOHANG), -1);
    EXPECT_EQ(errno, ECHILD);
}

TEST(Process, NonPositivePidIsNeverAlive) {
    EXPECT_FALSE(platform::process_exists(0));
    EXPECT_FALSE(platform::process_exists(-1));
}

TEST(Process, TerminateStopsChild) {
    int pid = platform::spawn_detached("sleep", {"30"});
    ASSERT_GT(pid, 0);

    auto start = std::chrono::steady_clock::now();
    platform::terminate_process(pid, 2000);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(platform::process_exists(pid));
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2500);
}

TEST(Process, TerminateMissingPidIsQuiet) {
    int pid = platform::spawn_detached("true", {});
    ASSERT_GT(pid, 0);
    ASSERT_TRUE(wait_until_gone(pid, 2000));

    // Already reaped: SIGTERM fails with ESRCH and that is not an error.
    EXPECT_NO_THROW(platform::terminate_process(pid, 200));
    EXPECT_FALSE(platform::process_exists(pid));
}

TEST(Process, RunForegroundExitCodes) {
    EXPECT_EQ(platform::run_foreground("sh", {"-c", "exit 3"}), 3);
    EXPECT_EQ(platform::run_foreground("sh", {"-c", "test \"$KUBECONFIG\" = /tmp/k.yaml"},
                                       {{"KUBECONFIG", "/tmp/k.yaml"}}), 0);
    EXPECT_EQ(platform::run_foreground("/nonexistent/ktun-test-binary", {}), 127);
}

TEST(Process, SystemLauncherRejectsEmptyArgv) {
    SystemProcessLauncher launcher;
    EXPECT_THROW(launcher.spawn({}), std::invalid_argument);
}

TEST(Process, SystemLauncherLifecycle) {
    SystemProcessLauncher launcher;
    int pid = launcher.spawn({"sleep", "5"});
    EXPECT_TRUE(launcher.is_alive(pid));
    launcher.terminate(pid);
    EXPECT_FALSE(launcher.is_alive(pid));
}
