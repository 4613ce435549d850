#include "backup/preflight.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

Preflight::Preflight(const BackupConfig& config, std::shared_ptr<PackageManager> packageManager,
                     std::shared_ptr<ConfirmationGate> gate)
    : config_(config)
    , packageManager_(std::move(packageManager))
    , gate_(std::move(gate)) {
}

void Preflight::run(BackupMode mode, bool restore) {
    checkPrivileges(restore);
    checkTools(requiredTools(config_, mode, restore));
    checkDiskSpace(config_.workDir, config_.requiredFreeKb);
}

std::vector<std::string> Preflight::requiredTools(const BackupConfig& config, BackupMode mode, bool restore) {
    std::vector<std::string> tools;
    switch (mode) {
        case BackupMode::SELECTIVE:
            tools = {"rsync", "tar"};
            break;
        case BackupMode::DISK_IMAGE:
            if (restore) {
                tools = {"ddrescue", "tar"};
            } else {
                tools = {config.resumableImaging ? "ddrescue" : "dd", "tar"};
            }
            break;
        case BackupMode::SNAPSHOT_STORE:
            tools = {"borg"};
            break;
    }
    if (restore && mode != BackupMode::SNAPSHOT_STORE) {
        tools.push_back("rsync");
    }
    for (const auto& tool : config.requiredTools) {
        tools.push_back(tool);
    }
    std::sort(tools.begin(), tools.end());
    tools.erase(std::unique(tools.begin(), tools.end()), tools.end());
    return tools;
}

void Preflight::checkTools(const std::vector<std::string>& tools) {
    std::vector<PackageSpec> missing;
    std::string names;
    for (const auto& tool : tools) {
        if (!packageManager_->isToolAvailable(tool)) {
            missing.push_back({PackageSource::RPM, tool});
            names += (names.empty() ? "" : " ") + tool;
        }
    }
    if (missing.empty()) {
        Logger::debug("All required tools are installed");
        return;
    }

    Logger::warning("Missing required tools: " + names);
    if (gate_->ask("The following tools are missing: " + names + ". Do you want to install them?") == Decision::NO) {
        throw ConfigurationError("Required tools are missing: " + names);
    }
    ToolResult installed = packageManager_->installPackages(missing);
    if (!installed.success) {
        throw ConfigurationError("Failed to install required tools: " + installed.errorMessage);
    }
    for (const auto& package : missing) {
        if (!packageManager_->isToolAvailable(package.name)) {
            throw ConfigurationError("Tool still missing after installation: " + package.name);
        }
    }
}

void Preflight::checkDiskSpace(const std::string& path, uint64_t requiredKb) const {
    std::error_code ec;
    fs::space_info space = fs::space(path, ec);
    if (ec) {
        throw ConfigurationError("Failed to query free space at " + path + ": " + ec.message());
    }
    uint64_t availableKb = space.available / 1024;
    if (availableKb < requiredKb) {
        throw ConfigurationError("Not enough disk space at " + path + ". Required: " +
                                 std::to_string(requiredKb) + " KB, available: " +
                                 std::to_string(availableKb) + " KB");
    }
    Logger::debug("Free space at " + path + ": " + std::to_string(availableKb) + " KB");
}

void Preflight::checkPrivileges(bool restore) const {
    if (!restore || config_.useSudo || geteuid() == 0) {
        return;
    }
    throw ConfigurationError("Restoring requires root privileges (run as root or set use_sudo)");
}
