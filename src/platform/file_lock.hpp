#pragma once
#include <string>

// RAII exclusive lock on a lock file, via flock().
// The lock is released when the object is destroyed or the process exits.
class FileLock {
public:
    // Blocks until the lock is acquired or timeout_ms elapses (-1 = wait forever).
    // Check held() after construction.
    explicit FileLock(const std::string& lock_path, int timeout_ms = -1);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    bool held() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    // errno-derived reason when held() is false
    const std::string& error() const { return error_; }

private:
    void release();

    int fd_ = -1;
    std::string path_;
    std::string error_;
};
