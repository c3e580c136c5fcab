#include "instance_lock.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

static std::string read_holder(int fd) {
    char buf[32] = {};
    ssize_t n = pread(fd, buf, sizeof(buf) - 1, 0);
    if (n <= 0) return "";
    std::string pid(buf, static_cast<size_t>(n));
    while (!pid.empty() && (pid.back() == '\n' || pid.back() == ' ')) pid.pop_back();
    return pid;
}

std::unique_ptr<InstanceLock> InstanceLock::try_acquire(const std::filesystem::path& path,
                                                        std::string* holder) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    int fd = open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (holder) holder->clear();
        return nullptr;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (holder) *holder = read_holder(fd);
        close(fd);
        return nullptr;
    }

    // Record our pid for whoever loses the race next
    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) == 0) {
        ssize_t written = pwrite(fd, pid.data(), pid.size(), 0);
        (void)written;
    }
    return std::unique_ptr<InstanceLock>(new InstanceLock(path, fd));
}

InstanceLock::~InstanceLock() {
    // Closing the descriptor releases the flock
    close(fd_);
}
