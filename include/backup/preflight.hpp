#pragma once

#include "backup/backup_config.hpp"
#include "backup/collaborators.hpp"
#include "backup/confirmation_gate.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Checks run before any step. Each throws ConfigurationError.
class Preflight {
public:
    Preflight(const BackupConfig& config, std::shared_ptr<PackageManager> packageManager,
              std::shared_ptr<ConfirmationGate> gate);

    void run(BackupMode mode, bool restore);

    // Offers to install whatever is missing.
    void checkTools(const std::vector<std::string>& tools);
    void checkDiskSpace(const std::string& path, uint64_t requiredKb) const;
    void checkPrivileges(bool restore) const;

    static std::vector<std::string> requiredTools(const BackupConfig& config, BackupMode mode, bool restore);

private:
    const BackupConfig& config_;
    std::shared_ptr<PackageManager> packageManager_;
    std::shared_ptr<ConfirmationGate> gate_;
};
