#include "file_lock.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <filesystem>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

FileLock::FileLock(const std::string& lock_path, int timeout_ms)
    : path_(lock_path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(lock_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error(fmt::format("Cannot open lock file '{}': {}",
                                             lock_path, std::strerror(errno)));
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        if (errno != EWOULDBLOCK && errno != EINTR) {
            int err = errno;
            close(fd_);
            fd_ = -1;
            throw std::runtime_error(fmt::format("flock('{}') failed: {}",
                                                 lock_path, std::strerror(err)));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            close(fd_);
            fd_ = -1;
            throw LockTimeout(fmt::format(
                "Timed out after {}ms waiting for lock '{}' (held by another ktun process)",
                timeout_ms, lock_path));
        }
        platform::sleep_ms(LOCK_POLL_MS);
    }
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() {
    if (fd_ < 0) return;
    close(fd_);  // flock is released when the fd is closed
    fd_ = -1;
}
