#pragma once

#include <chrono>
#include <string>

enum class BackupMode {
    SELECTIVE,
    DISK_IMAGE,
    SNAPSHOT_STORE
};

std::string toString(BackupMode mode);
bool parseBackupMode(const std::string& name, BackupMode& mode);

// One backup or restore run, identified by its timestamp-derived directory
// (e.g. /srv/backups/backup_20240101_000000). The directory, its journal
// and its report outlive the process so that a later run can resume.
class Job {
public:
    enum class Phase {
        CREATED,
        RUNNING,
        ARCHIVED,
        ENCRYPTED,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    static constexpr const char* kMetadataFile = "job.json";
    static constexpr const char* kManifestDir = ".manifest";
    static constexpr const char* kErrorLogFile = "error.log";
    static constexpr const char* kLockFile = ".lock";
    static constexpr const char* kDiskImageMarker = "disk_image";
    static constexpr const char* kSnapshotMarker = "snapshot";

    // Creates <workDir>/backup_YYYYMMDD_HHMMSS and writes its metadata.
    static Job create(const std::string& workDir, BackupMode mode,
                      std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Opens an existing job directory. The directory is created when only
    // the archived artifacts (<dir>.tar.gz[.enc]) remain.
    static Job open(const std::string& jobDir);

    // snapshot/ marks a snapshot-store job, disk_image/ a disk-image job,
    // anything else is selective.
    static BackupMode detectMode(const std::string& jobDir);

    // Most recent backup_* job (directory or archive) in workDir, or "".
    static std::string findLatest(const std::string& workDir);

    static std::string phaseToString(Phase phase);

    const std::string& getId() const { return id_; }
    const std::string& getPath() const { return path_; }
    BackupMode getMode() const { return mode_; }
    Phase getPhase() const { return phase_; }
    std::chrono::system_clock::time_point getCreatedAt() const { return createdAt_; }

    void setMode(BackupMode mode);
    void setPhase(Phase phase);

    // Re-reads job.json (or the directory markers), used after a restore
    // extracts the archived job tree.
    void refreshMode();

    std::string stepPath(const std::string& stepId) const;
    std::string manifestDir() const;
    std::string errorLogPath() const;
    std::string lockPath() const;
    std::string metadataPath() const;
    std::string archivePath() const { return path_ + ".tar.gz"; }
    std::string encryptedArchivePath() const { return path_ + ".tar.gz.enc"; }
    std::string passphrasePath() const { return path_ + ".passphrase"; }

    bool writeMetadata() const;

    // Explicit cleanup after a fatal error. Removes the directory and every
    // archived artifact of this job.
    bool cleanup();

private:
    Job(std::string path, BackupMode mode, std::chrono::system_clock::time_point createdAt);
    bool readMetadata();

    std::string id_;
    std::string path_;
    BackupMode mode_;
    Phase phase_{Phase::CREATED};
    std::chrono::system_clock::time_point createdAt_;
};
