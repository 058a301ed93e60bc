#pragma once

#include <string>
#include <stdexcept>

// Raised when the advisory lock could not be taken before the deadline.
class LockTimeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// RAII exclusive advisory lock on a file. Uses flock(), so the lock is
// released by the kernel when the process exits, even on a crash.
// The constructor blocks for at most timeout_ms, then throws LockTimeout.
class FileLock {
public:
    FileLock(const std::string& lock_path, int timeout_ms);
    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool held() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    // Release early. Safe to call more than once.
    void release();

private:
    std::string path_;
    int fd_ = -1;
};
