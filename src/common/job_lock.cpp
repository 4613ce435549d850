#include "common/job_lock.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

JobLock::JobLock(const std::string& lockPath)
    : lockPath_(lockPath) {
    fd_ = ::open(lockPath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw ConfigurationError("Failed to open lock file " + lockPath_ + ": " + strerror(errno));
    }

    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        if (err == EWOULDBLOCK) {
            throw JobLockedError(std::filesystem::path(lockPath_).parent_path().string());
        }
        throw ConfigurationError("Failed to lock " + lockPath_ + ": " + strerror(err));
    }
    Logger::debug("Acquired job lock " + lockPath_);
}

JobLock::~JobLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}
