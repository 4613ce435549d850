#pragma once

#include "common/job.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct BackupConfig {
    std::string workDir{"."};       // parent of the backup_* job directories
    std::string homeDir;            // user whose profile is captured, $HOME by default
    BackupMode mode{BackupMode::SELECTIVE};
    bool useSudo{false};            // run privileged tools through sudo
    bool continueOnError{false};
    bool yesToAllCoversDestructive{false};
    bool archive{true};             // selective / disk-image: compress the job
    bool encrypt{true};             // ...and encrypt the archive
    std::string passphraseFile;     // empty: generate one next to the archive
    std::string device;             // disk to image, asked for when empty
    bool resumableImaging{false};   // use ddrescue instead of dd
    std::string snapshotRepo;       // default <job>/snapshot
    std::vector<std::string> snapshotSources;
    std::string restorePath;        // snapshot restore destination, asked for when empty
    uint64_t requiredFreeKb{52428800};  // 50 GB
    std::vector<std::string> requiredTools;   // in addition to what the mode needs
    std::string logFile{"/tmp/hostkeeper.log"};
    std::string logLevel{"info"};

    // Unknown keys are ignored; a value of the wrong type throws
    // ConfigurationError.
    static BackupConfig fromFile(const std::string& path);
    static BackupConfig fromJsonText(const std::string& text);

    // Falls back to $HOME for homeDir.
    void applyEnvironment();
};
