#pragma once

#include <filesystem>
#include <memory>
#include <string>

// Advisory flock() on ~/.keepsake/keepsake.lock. A scheduler daemon, the
// REPL and a one-shot `keepsake run` all take it, so two processes never
// drive backups into the same destination. The kernel drops the lock with
// the descriptor, so a crashed holder never leaves it stuck.
class InstanceLock {
public:
    // Returns nullptr when another process holds the lock. `holder` (if
    // given) receives the pid recorded by that process, or "" if unknown.
    static std::unique_ptr<InstanceLock> try_acquire(const std::filesystem::path& path,
                                                     std::string* holder = nullptr);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    InstanceLock(std::filesystem::path path, int fd) : path_(std::move(path)), fd_(fd) {}

    std::filesystem::path path_;
    int fd_;
};
