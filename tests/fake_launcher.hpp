#pragma once

#include <platform/process.hpp>
#include <set>
#include <vector>
#include <string>
#include <stdexcept>

// In-memory process table for manager tests.
class FakeProcessLauncher : public ProcessLauncher {
public:
    int spawn(const std::vector<std::string>& argv) override {
        if (fail_spawn) throw std::runtime_error("fork() failed while starting '" + argv[0] + "'");
        spawned.push_back(argv);
        int pid = next_pid++;
        alive.insert(pid);
        return pid;
    }

    bool is_alive(int pid) override { return alive.count(pid) > 0; }

    void terminate(int pid) override {
        terminated.push_back(pid);
        alive.erase(pid);
    }

    // Simulate the process dying on its own.
    void kill(int pid) { alive.erase(pid); }

    std::vector<std::vector<std::string>> spawned;
    std::vector<int> terminated;
    std::set<int> alive;
    int next_pid = 1000;
    bool fail_spawn = false;
};
