#pragma once

#include <string>

// Exclusive advisory lock on a job directory, held for the lifetime of the
// object. Throws JobLockedError when another process already holds it.
class JobLock {
public:
    explicit JobLock(const std::string& lockPath);
    ~JobLock();

    JobLock(const JobLock&) = delete;
    JobLock& operator=(const JobLock&) = delete;

    const std::string& getPath() const { return lockPath_; }

private:
    std::string lockPath_;
    int fd_{-1};
};
