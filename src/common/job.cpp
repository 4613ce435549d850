#include "common/job.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* kJobPrefix = "backup_";

bool parsePhase(const std::string& name, Job::Phase& phase) {
    static const Job::Phase phases[] = {
        Job::Phase::CREATED, Job::Phase::RUNNING, Job::Phase::ARCHIVED, Job::Phase::ENCRYPTED,
        Job::Phase::COMPLETED, Job::Phase::FAILED, Job::Phase::CANCELLED
    };
    for (auto candidate : phases) {
        if (Job::phaseToString(candidate) == name) {
            phase = candidate;
            return true;
        }
    }
    return false;
}

// backup_20240101_000000.tar.gz.enc -> backup_20240101_000000
std::string stripArtifactSuffix(const std::string& name) {
    for (const char* suffix : {".tar.gz.enc", ".tar.gz"}) {
        std::string s(suffix);
        if (name.size() > s.size() && name.compare(name.size() - s.size(), s.size(), s) == 0) {
            return name.substr(0, name.size() - s.size());
        }
    }
    return name;
}

} // namespace

std::string toString(BackupMode mode) {
    switch (mode) {
        case BackupMode::SELECTIVE:      return "selective";
        case BackupMode::DISK_IMAGE:     return "disk-image";
        case BackupMode::SNAPSHOT_STORE: return "snapshot";
        default:                         return "unknown";
    }
}

bool parseBackupMode(const std::string& name, BackupMode& mode) {
    if (name == "selective" || name == "manual") {
        mode = BackupMode::SELECTIVE;
    } else if (name == "disk-image" || name == "disk_image" || name == "image") {
        mode = BackupMode::DISK_IMAGE;
    } else if (name == "snapshot" || name == "snapshot-store" || name == "borg") {
        mode = BackupMode::SNAPSHOT_STORE;
    } else {
        return false;
    }
    return true;
}

Job::Job(std::string path, BackupMode mode, std::chrono::system_clock::time_point createdAt)
    : id_(fs::path(path).filename().string())
    , path_(std::move(path))
    , mode_(mode)
    , createdAt_(createdAt) {
}

Job Job::create(const std::string& workDir, BackupMode mode,
                std::chrono::system_clock::time_point now) {
    fs::path jobPath = fs::path(workDir) / utils::makeJobName(now);
    std::error_code ec;
    fs::create_directories(jobPath, ec);
    if (ec) {
        throw ConfigurationError("Failed to create job directory " + jobPath.string() + ": " + ec.message());
    }

    Job job(jobPath.string(), mode, now);
    if (!job.writeMetadata()) {
        throw ConfigurationError("Failed to write job metadata in " + jobPath.string());
    }
    Logger::info("Created job " + job.getId() + " (" + toString(mode) + ")");
    return job;
}

Job Job::open(const std::string& jobDir) {
    fs::path jobPath = fs::path(stripArtifactSuffix(jobDir));
    if (jobPath.filename().empty()) {
        jobPath = jobPath.parent_path();
    }

    std::error_code ec;
    if (!fs::is_directory(jobPath, ec)) {
        bool hasArtifact = fs::exists(jobPath.string() + ".tar.gz", ec) ||
                           fs::exists(jobPath.string() + ".tar.gz.enc", ec);
        if (!hasArtifact) {
            throw ConfigurationError("Job not found: " + jobPath.string());
        }
        fs::create_directories(jobPath, ec);
        if (ec) {
            throw ConfigurationError("Failed to create job directory " + jobPath.string() + ": " + ec.message());
        }
    }

    Job job(jobPath.string(), detectMode(jobPath.string()), std::chrono::system_clock::now());
    job.readMetadata();
    return job;
}

BackupMode Job::detectMode(const std::string& jobDir) {
    std::error_code ec;
    if (fs::is_directory(fs::path(jobDir) / kSnapshotMarker, ec)) {
        return BackupMode::SNAPSHOT_STORE;
    }
    if (fs::is_directory(fs::path(jobDir) / kDiskImageMarker, ec)) {
        return BackupMode::DISK_IMAGE;
    }
    return BackupMode::SELECTIVE;
}

std::string Job::findLatest(const std::string& workDir) {
    std::vector<std::string> candidates;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(workDir, ec)) {
        std::string name = entry.path().filename().string();
        if (!utils::startsWith(name, kJobPrefix)) {
            continue;
        }
        std::string base = stripArtifactSuffix(name);
        if (base.find('.') != std::string::npos) {
            continue;  // .passphrase and other side files
        }
        candidates.push_back((fs::path(workDir) / base).string());
    }
    if (candidates.empty()) {
        return "";
    }
    // Timestamped names sort chronologically
    return *std::max_element(candidates.begin(), candidates.end());
}

std::string Job::phaseToString(Phase phase) {
    switch (phase) {
        case Phase::CREATED:   return "created";
        case Phase::RUNNING:   return "running";
        case Phase::ARCHIVED:  return "archived";
        case Phase::ENCRYPTED: return "encrypted";
        case Phase::COMPLETED: return "completed";
        case Phase::FAILED:    return "failed";
        case Phase::CANCELLED: return "cancelled";
        default:               return "unknown";
    }
}

void Job::setMode(BackupMode mode) {
    mode_ = mode;
    writeMetadata();
}

void Job::setPhase(Phase phase) {
    phase_ = phase;
    writeMetadata();
}

void Job::refreshMode() {
    mode_ = detectMode(path_);
    readMetadata();
}

std::string Job::stepPath(const std::string& stepId) const {
    return (fs::path(path_) / stepId).string();
}

std::string Job::manifestDir() const {
    return (fs::path(path_) / kManifestDir).string();
}

std::string Job::errorLogPath() const {
    return (fs::path(path_) / kErrorLogFile).string();
}

std::string Job::lockPath() const {
    return (fs::path(path_) / kLockFile).string();
}

std::string Job::metadataPath() const {
    return (fs::path(path_) / kMetadataFile).string();
}

bool Job::writeMetadata() const {
    try {
        json metadata;
        metadata["id"] = id_;
        metadata["mode"] = toString(mode_);
        metadata["phase"] = phaseToString(phase_);
        metadata["created_at"] = std::chrono::duration_cast<std::chrono::seconds>(
            createdAt_.time_since_epoch()).count();

        // Write-then-rename so a crash never leaves a truncated file behind
        std::string tmpPath = metadataPath() + ".tmp";
        {
            std::ofstream file(tmpPath, std::ios::trunc);
            if (!file.is_open()) {
                Logger::error("Failed to open metadata file for writing: " + tmpPath);
                return false;
            }
            file << metadata.dump(4);
            if (!file) {
                Logger::error("Failed to write metadata file: " + tmpPath);
                return false;
            }
        }
        fs::rename(tmpPath, metadataPath());
        return true;
    } catch (const std::exception& e) {
        Logger::error("Failed to write job metadata: " + std::string(e.what()));
        return false;
    }
}

bool Job::readMetadata() {
    std::ifstream file(metadataPath());
    if (!file.is_open()) {
        return false;
    }

    try {
        json metadata;
        file >> metadata;

        BackupMode mode;
        if (metadata.contains("mode") && parseBackupMode(metadata["mode"].get<std::string>(), mode)) {
            mode_ = mode;
        }
        Phase phase;
        if (metadata.contains("phase") && parsePhase(metadata["phase"].get<std::string>(), phase)) {
            phase_ = phase;
        }
        if (metadata.contains("created_at")) {
            createdAt_ = std::chrono::system_clock::time_point(
                std::chrono::seconds(metadata["created_at"].get<int64_t>()));
        }
        return true;
    } catch (const std::exception& e) {
        Logger::warning("Ignoring unreadable job metadata " + metadataPath() + ": " + e.what());
        return false;
    }
}

bool Job::cleanup() {
    std::error_code ec;
    bool ok = true;
    for (const auto& target : {path_, archivePath(), encryptedArchivePath()}) {
        fs::remove_all(target, ec);
        if (ec) {
            Logger::error("Failed to remove " + target + ": " + ec.message());
            ok = false;
        }
    }
    Logger::info("Removed job " + id_);
    return ok;
}
