#include "singleton.hpp"
#include <filesystem>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

SingletonLock::SingletonLock(const std::string& lock_path) {
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(lock_path).parent_path(), ec);

    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) return;
    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        close(fd_);
        fd_ = -1;
        return;
    }

    // Record the holder's pid for operators.
    if (ftruncate(fd_, 0) == 0) {
        std::string pid = std::to_string(getpid()) + "\n";
        ssize_t n = write(fd_, pid.data(), pid.size());
        (void)n;
    }
}

SingletonLock::~SingletonLock() {
    if (fd_ < 0) return;
    close(fd_);
    // flock is released automatically when fd is closed
}
