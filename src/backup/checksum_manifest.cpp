#include "backup/checksum_manifest.hpp"
#include "common/checksum.hpp"
#include "common/job.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::string ChecksumManifest::pathFor(const std::string& jobDir, const std::string& stepId) {
    return (fs::path(jobDir) / Job::kManifestDir / (stepId + ".sha256")).string();
}

std::string ChecksumManifest::digestEntry(const std::string& path, std::string& error) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    if (ec) {
        error = "Failed to stat " + path + ": " + ec.message();
        return "";
    }
    if (fs::is_symlink(status)) {
        fs::path target = fs::read_symlink(path, ec);
        if (ec) {
            error = "Failed to read link " + path + ": " + ec.message();
            return "";
        }
        return Checksum::sha256("symlink:" + target.string());
    }
    if (fs::is_regular_file(status)) {
        return Checksum::sha256File(path, error);
    }
    // Device nodes, fifos and sockets carry no content
    return Checksum::sha256("special:" + std::to_string(static_cast<int>(status.type())));
}

bool ChecksumManifest::build(const std::string& root, const std::string& stepId,
                             std::vector<ManifestEntry>& entries, std::string& error) {
    entries.clear();
    fs::path stepDir = fs::path(root) / stepId;
    std::error_code ec;
    if (!fs::exists(stepDir, ec)) {
        return true;
    }

    try {
        for (const auto& entry : fs::recursive_directory_iterator(stepDir)) {
            if (entry.is_directory() && !entry.is_symlink()) {
                continue;
            }
            std::string checksum = digestEntry(entry.path().string(), error);
            if (checksum.empty()) {
                return false;
            }
            // Lexical: fs::relative() would resolve a symlink to its target
            entries.push_back({checksum, entry.path().lexically_relative(root).generic_string()});
        }
    } catch (const fs::filesystem_error& e) {
        error = "Failed to walk " + stepDir.string() + ": " + e.what();
        return false;
    }

    std::sort(entries.begin(), entries.end(),
              [](const ManifestEntry& a, const ManifestEntry& b) { return a.relativePath < b.relativePath; });
    return true;
}

bool ChecksumManifest::write(const std::string& manifestPath, const std::vector<ManifestEntry>& entries,
                             std::string& error) {
    std::error_code ec;
    fs::create_directories(fs::path(manifestPath).parent_path(), ec);
    if (ec) {
        error = "Failed to create manifest directory: " + ec.message();
        return false;
    }

    std::ostringstream content;
    for (const auto& entry : entries) {
        content << entry.checksum << "  " << entry.relativePath << "\n";
    }

    std::string tmpPath = manifestPath + ".tmp";
    int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "Failed to open " + tmpPath + ": " + strerror(errno);
        return false;
    }
    std::string data = content.str();
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            break;
        }
        written += static_cast<size_t>(n);
    }
    // The journal line that follows must never outlive its manifest
    bool synced = written == data.size() && ::fsync(fd) == 0;
    int err = errno;
    ::close(fd);
    if (!synced) {
        error = "Failed to write " + tmpPath + ": " + strerror(err);
        return false;
    }

    fs::rename(tmpPath, manifestPath, ec);
    if (ec) {
        error = "Failed to replace " + manifestPath + ": " + ec.message();
        return false;
    }

    std::string dir = fs::path(manifestPath).parent_path().string();
    int dirFd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd < 0) {
        error = "Failed to open " + dir + ": " + strerror(errno);
        return false;
    }
    synced = ::fsync(dirFd) == 0;
    err = errno;
    ::close(dirFd);
    if (!synced) {
        error = "Failed to sync " + dir + ": " + strerror(err);
        return false;
    }
    return true;
}

bool ChecksumManifest::read(const std::string& manifestPath, std::vector<ManifestEntry>& entries,
                            std::string& error) {
    entries.clear();
    std::ifstream file(manifestPath);
    if (!file.is_open()) {
        error = "Failed to open manifest " + manifestPath;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) {
            continue;
        }
        auto separator = line.find("  ");
        if (separator == std::string::npos) {
            error = "Malformed manifest line in " + manifestPath + ": " + line;
            return false;
        }
        entries.push_back({line.substr(0, separator), line.substr(separator + 2)});
    }
    return true;
}

bool ChecksumManifest::commit(const std::string& jobDir, const std::string& stepId, std::string& error) {
    std::vector<ManifestEntry> entries;
    if (!build(jobDir, stepId, entries, error)) {
        return false;
    }
    if (!write(pathFor(jobDir, stepId), entries, error)) {
        return false;
    }
    Logger::debug("Recorded " + std::to_string(entries.size()) + " checksums for " + stepId);
    return true;
}
