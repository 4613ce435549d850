#include "backup/state_journal.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

bool writeAll(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

StateJournal::StateJournal(std::string path)
    : path_(std::move(path)) {
}

ResumeState StateJournal::load() const {
    ResumeState state;
    std::ifstream file(path_);
    if (!file.is_open()) {
        return state;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string entry = utils::trim(line);
        if (entry.empty()) {
            continue;
        }

        std::string stepId = entry;
        auto tab = entry.find('\t');
        if (tab != std::string::npos) {
            stepId = utils::trim(entry.substr(0, tab));
            try {
                double seconds = std::stod(entry.substr(tab + 1));
                state.durations.emplace(stepId, seconds);
            } catch (const std::exception&) {
                Logger::warning("Ignoring malformed duration in journal " + path_ + ": " + entry);
            }
        }
        if (!stepId.empty()) {
            state.done.insert(stepId);
        }
    }
    return state;
}

void StateJournal::append(const std::string& stepId, double seconds) {
    if (load().contains(stepId)) {
        Logger::debug("Journal already holds " + stepId);
        return;
    }

    std::ostringstream line;
    line << stepId << '\t' << seconds << '\n';

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw OrchestrationError("Failed to open journal " + path_ + ": " + strerror(errno));
    }
    // A crash mid-append can leave a line without its newline; never extend it
    std::string data = line.str();
    struct stat info;
    char last = '\n';
    if (::fstat(fd, &info) == 0 && info.st_size > 0 && ::pread(fd, &last, 1, info.st_size - 1) == 1 &&
        last != '\n') {
        Logger::warning("Journal " + path_ + " ends with a partial line, terminating it");
        data.insert(data.begin(), '\n');
    }

    if (!writeAll(fd, data)) {
        int err = errno;
        ::close(fd);
        throw OrchestrationError("Failed to write journal " + path_ + ": " + strerror(err));
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw OrchestrationError("Failed to sync journal " + path_ + ": " + strerror(err));
    }
    ::close(fd);
    Logger::debug("Journaled " + stepId);
}

ErrorLog::ErrorLog(std::string path)
    : path_(std::move(path)) {
}

bool ErrorLog::append(const std::string& stepId, const std::string& message) const {
    FILE* file = fopen(path_.c_str(), "a");
    if (!file) {
        Logger::error("Failed to open error log " + path_ + ": " + strerror(errno));
        return false;
    }
    std::string line = utils::formatTime(std::chrono::system_clock::now()) +
                       " [" + stepId + "] Error: " + message + "\n";
    fputs(line.c_str(), file);
    fflush(file);
    fsync(fileno(file));
    fclose(file);
    return true;
}
