#include "file_lock.hpp"
#include "platform.hpp"
#include <filesystem>
#include <cerrno>
#include <cstring>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

FileLock::FileLock(const std::string& lock_path, int timeout_ms) : path_(lock_path) {
    std::error_code ec;
    auto parent = std::filesystem::path(lock_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        error_ = std::strerror(errno);
        return;
    }

    if (timeout_ms < 0) {
        while (flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            error_ = std::strerror(errno);
            release();
            return;
        }
        return;
    }

    int waited = 0;
    while (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        if (errno != EWOULDBLOCK && errno != EINTR) {
            error_ = std::strerror(errno);
            release();
            return;
        }
        if (waited >= timeout_ms) {
            error_ = "timed out waiting for lock";
            release();
            return;
        }
        platform::sleep_ms(50);
        waited += 50;
    }
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)), error_(std::move(other.error_)) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        error_ = std::move(other.error_);
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() {
    if (fd_ < 0) return;
    // flock is released automatically when fd is closed
    close(fd_);
    fd_ = -1;
}
