#include "restore/restore_plan.hpp"
#include "backup/package_list.hpp"
#include "backup/state_journal.hpp"
#include "backup/step_catalog.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

bool exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

// The job tree is live once the backup journal is on disk.
bool isExtracted(const Job& job) {
    return exists((fs::path(job.getPath()) / StateJournal::kBackupJournal).string());
}

bool backupCompleted(const Job& job, const std::string& stepId) {
    StateJournal journal((fs::path(job.getPath()) / StateJournal::kBackupJournal).string());
    return journal.load().contains(stepId);
}

std::string readPassphrase(const std::string& path) {
    std::ifstream file(path);
    std::string passphrase;
    if (file.is_open()) {
        std::getline(file, passphrase);
    }
    return utils::trim(passphrase);
}

void addUnpackSteps(StepRegistry& registry, const BackupConfig& config, const Collaborators& tools,
                    std::shared_ptr<ConfirmationGate> gate, Job& job) {
    Step decrypt;
    decrypt.id = "decrypt";
    decrypt.description = "decrypt the backup archive";
    decrypt.kind = StepKind::FINALIZE;
    decrypt.sources = {job.encryptedArchivePath()};
    decrypt.destination = job.archivePath();
    decrypt.applicable = [&job]() {
        return exists(job.encryptedArchivePath()) && !exists(job.archivePath()) && !isExtracted(job);
    };
    auto cipher = tools.cipher;
    std::string passphraseFile = config.passphraseFile;
    decrypt.action = [cipher, gate, passphraseFile](const StepContext& ctx) {
        std::string passphrase;
        if (!passphraseFile.empty()) {
            passphrase = readPassphrase(passphraseFile);
        }
        if (passphrase.empty()) {
            passphrase = readPassphrase(ctx.job.passphrasePath());
        }
        if (passphrase.empty()) {
            passphrase = gate->askText("Enter the decryption passphrase:");
        }
        if (passphrase.empty()) {
            return ToolResult::failure("No passphrase given for " + ctx.job.encryptedArchivePath());
        }
        return cipher->decrypt(ctx.job.encryptedArchivePath(), ctx.job.archivePath(), passphrase);
    };
    registry.add(decrypt);

    Step extract;
    extract.id = "extract";
    extract.description = "extract the backup archive";
    extract.kind = StepKind::FINALIZE;
    extract.sources = {job.archivePath()};
    extract.destination = job.getPath();
    extract.applicable = [&job]() { return exists(job.archivePath()) && !isExtracted(job); };
    auto archiver = tools.archiver;
    extract.action = [archiver](const StepContext& ctx) {
        ToolResult result = archiver->extract(ctx.job.archivePath(), ctx.job.getPath());
        if (!result.success) {
            return result;
        }
        ctx.job.refreshMode();
        Logger::info("Detected backup type: " + toString(ctx.job.getMode()));

        // The plaintext archive only exists because decrypt produced it
        if (exists(ctx.job.encryptedArchivePath())) {
            std::error_code ec;
            fs::remove(ctx.job.archivePath(), ec);
            if (ec) {
                Logger::warning("Failed to remove decrypted archive: " + ec.message());
            }
        }
        return ToolResult::ok();
    };
    registry.add(extract);
}

void addDirectorySteps(StepRegistry& registry, const BackupConfig& config, const Collaborators& tools, Job& job) {
    auto fileSync = tools.fileSync;
    for (const auto& directory : capturedDirectories(config.homeDir)) {
        if (!directory.restorable) {
            continue;
        }

        Step step;
        step.id = "restore_" + directory.id;
        step.description = "restore " + directory.sources.front().path;
        step.kind = StepKind::RESTORE;
        step.destructive = true;
        step.sources = {directory.id};
        for (const auto& source : directory.sources) {
            step.destination += (step.destination.empty() ? "" : " ") + source.path;
        }

        std::string id = directory.id;
        auto sources = directory.sources;
        step.applicable = [&job, id]() {
            return job.getMode() == BackupMode::SELECTIVE &&
                   exists(job.stepPath(id)) && backupCompleted(job, id);
        };
        step.action = [fileSync, id, sources](const StepContext& ctx) {
            for (const auto& source : sources) {
                fs::path from = fs::path(ctx.job.stepPath(id));
                if (!source.subdir.empty()) {
                    from /= source.subdir;
                }
                if (!exists(from.string())) {
                    Logger::info("Nothing captured for " + source.path);
                    continue;
                }
                std::string workDir = fs::path(ctx.job.getPath()).parent_path().string();
                ToolResult result = fileSync->syncTree(from.string(), source.path, true,
                                                       excludesWithin(source.path, workDir));
                if (!result.success) {
                    return result;
                }
            }
            return ToolResult::ok();
        };
        registry.add(step);
    }
}

void addPackageStep(StepRegistry& registry, const std::string& id, const std::string& description,
                    const Collaborators& tools, Job& job) {
    Step step;
    step.id = "restore_" + id;
    step.description = description;
    step.kind = StepKind::RESTORE;
    step.destructive = true;
    step.sources = {id + "/packages.json"};

    auto packageManager = tools.packageManager;
    step.applicable = [&job, id]() {
        return job.getMode() == BackupMode::SELECTIVE &&
               exists((fs::path(job.stepPath(id)) / "packages.json").string()) && backupCompleted(job, id);
    };
    step.action = [packageManager, id](const StepContext& ctx) {
        std::vector<PackageSpec> packages;
        std::string error;
        if (!PackageList::load((fs::path(ctx.job.stepPath(id)) / "packages.json").string(), packages, error)) {
            return ToolResult::failure(error);
        }
        if (packages.empty()) {
            Logger::info("No packages recorded in " + id);
            return ToolResult::ok();
        }
        return packageManager->installPackages(packages);
    };
    registry.add(step);
}

void addDiskImageStep(StepRegistry& registry, const BackupConfig& config, const Collaborators& tools,
                      std::shared_ptr<ConfirmationGate> gate, Job& job) {
    Step step;
    step.id = "restore_disk_image";
    step.description = "restore the disk image";
    step.kind = StepKind::RESTORE;
    step.destructive = true;
    step.sources = {std::string(Job::kDiskImageMarker) + "/disk-image.img"};

    auto imager = tools.blockImager;
    std::string configured = config.device;
    step.applicable = [&job]() {
        return job.getMode() == BackupMode::DISK_IMAGE &&
               exists((fs::path(job.stepPath(Job::kDiskImageMarker)) / "disk-image.img").string());
    };
    step.resolveTarget = [imager, gate, configured](std::string& device) {
        device = configured.empty()
            ? utils::trim(gate->askText("Enter the disk to restore to (e.g. /dev/sda):"))
            : configured;
        if (device.empty()) {
            return ToolResult::failure("No disk given to restore to");
        }
        if (!imager->isBlockDevice(device)) {
            return ToolResult::failure("Invalid disk, not a block device: " + device);
        }
        return ToolResult::ok();
    };
    step.action = [imager](const StepContext& ctx) {
        std::string image = (fs::path(ctx.job.stepPath(Job::kDiskImageMarker)) / "disk-image.img").string();
        return imager->writeDevice(image, ctx.target);
    };
    registry.add(step);
}

void addSnapshotStep(StepRegistry& registry, const BackupConfig& config, const Collaborators& tools,
                     std::shared_ptr<ConfirmationGate> gate, Job& job) {
    Step step;
    step.id = "restore_snapshot";
    step.description = "restore the latest snapshot";
    step.kind = StepKind::RESTORE;
    step.destructive = true;

    auto store = tools.snapshotStore;
    std::string configuredRepo = config.snapshotRepo;
    std::string configuredPath = config.restorePath;
    step.applicable = [&job]() { return job.getMode() == BackupMode::SNAPSHOT_STORE; };
    step.resolveTarget = [gate, configuredPath](std::string& path) {
        path = configuredPath.empty()
            ? utils::trim(gate->askText("Enter the path to restore the snapshot to:"))
            : configuredPath;
        if (path.empty()) {
            return ToolResult::failure("No restore path given");
        }
        return ToolResult::ok();
    };
    step.action = [store, configuredRepo](const StepContext& ctx) {
        std::string repo = configuredRepo.empty() ? ctx.job.stepPath(Job::kSnapshotMarker) : configuredRepo;
        std::string archiveId;
        ToolResult result = store->latestArchive(repo, archiveId);
        if (!result.success) {
            return result;
        }
        Logger::info("Restoring snapshot " + archiveId + " to " + ctx.target);
        return store->restore(repo, archiveId, ctx.target);
    };
    registry.add(step);
}

} // namespace

StepRegistry buildRestorePlan(const BackupConfig& config, const Collaborators& tools,
                              std::shared_ptr<ConfirmationGate> gate, Job& job) {
    StepRegistry registry;
    addUnpackSteps(registry, config, tools, gate, job);
    addDirectorySteps(registry, config, tools, job);
    addPackageStep(registry, "packages", "reinstall RPM and Flatpak packages", tools, job);
    addPackageStep(registry, "pip", "reinstall pip packages", tools, job);
    addDiskImageStep(registry, config, tools, gate, job);
    addSnapshotStep(registry, config, tools, gate, job);
    Logger::debug("Restore plan: " + std::to_string(registry.size()) + " steps");
    return registry;
}
