#include "backup/backup_plan.hpp"
#include "backup/package_list.hpp"
#include "backup/step_catalog.hpp"
#include "backup/tools/openssl_cipher.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const char* kPackageFile = "packages.json";
const char* kDiskImageFile = "disk-image.img";

bool anyExists(const std::vector<CapturedSource>& sources) {
    std::error_code ec;
    for (const auto& source : sources) {
        if (fs::exists(source.path, ec)) {
            return true;
        }
    }
    return false;
}

Step directoryStep(const CapturedDirectory& directory, std::shared_ptr<FileSync> fileSync) {
    Step step;
    step.id = directory.id;
    step.description = directory.description;
    step.destination = directory.id;
    for (const auto& source : directory.sources) {
        step.sources.push_back(source.path);
    }

    auto sources = directory.sources;
    step.applicable = [sources]() { return anyExists(sources); };
    step.action = [sources, fileSync](const StepContext& ctx) {
        std::error_code ec;
        for (const auto& source : sources) {
            if (!fs::exists(source.path, ec)) {
                Logger::info("Skipping missing " + source.path);
                continue;
            }
            std::string dest = source.subdir.empty()
                ? ctx.outputDir
                : (fs::path(ctx.outputDir) / source.subdir).string();
            std::string workDir = fs::path(ctx.job.getPath()).parent_path().string();
            ToolResult result = fileSync->syncTree(source.path, dest, false, excludesWithin(source.path, workDir));
            if (!result.success) {
                return result;
            }
        }
        return ToolResult::ok();
    };
    return step;
}

Step packageStep(const std::string& id, const std::string& description,
                 std::vector<PackageSource> sources, std::shared_ptr<PackageManager> packageManager) {
    Step step;
    step.id = id;
    step.description = description;
    step.destination = id + "/" + kPackageFile;
    step.applicable = [sources, packageManager]() {
        for (auto source : sources) {
            if (packageManager->isToolAvailable(source == PackageSource::RPM ? "rpm" : toString(source))) {
                return true;
            }
        }
        return false;
    };
    step.action = [sources, packageManager](const StepContext& ctx) {
        std::vector<PackageSpec> all;
        for (auto source : sources) {
            std::vector<PackageSpec> packages;
            ToolResult result = packageManager->queryInstalledPackages(source, packages);
            if (!result.success) {
                return result;
            }
            all.insert(all.end(), packages.begin(), packages.end());
        }
        std::string error;
        if (!PackageList::save((fs::path(ctx.outputDir) / kPackageFile).string(), all, error)) {
            return ToolResult::failure(error);
        }
        return ToolResult::ok();
    };
    return step;
}

void addSelectiveSteps(StepRegistry& registry, const BackupConfig& config, const Collaborators& tools) {
    for (const auto& directory : capturedDirectories(config.homeDir)) {
        registry.add(directoryStep(directory, tools.fileSync));
    }

    registry.add(packageStep("packages", "back up the list of installed RPM and Flatpak packages",
                             {PackageSource::RPM, PackageSource::FLATPAK}, tools.packageManager));
    registry.add(packageStep("pip", "back up the list of pip packages",
                             {PackageSource::PIP}, tools.packageManager));

    Step databases;
    databases.id = "databases";
    databases.description = "dump MySQL and PostgreSQL databases";
    databases.destination = "databases";
    auto dumper = tools.databaseDumper;
    databases.applicable = [dumper]() { return dumper->isAvailable(); };
    databases.action = [dumper](const StepContext& ctx) { return dumper->dumpAll(ctx.outputDir); };
    registry.add(databases);

    registry.add(directoryStep(systemLogDirectory(), tools.fileSync));
}

void addDiskImageStep(StepRegistry& registry, const BackupConfig& config, const Collaborators& tools,
                      std::shared_ptr<ConfirmationGate> gate) {
    Step step;
    step.id = Job::kDiskImageMarker;
    step.description = "create a disk image";
    step.destination = std::string(Job::kDiskImageMarker) + "/" + kDiskImageFile;

    auto imager = tools.blockImager;
    std::string configured = config.device;
    step.resolveTarget = [imager, gate, configured](std::string& device) {
        device = configured.empty()
            ? utils::trim(gate->askText("Enter the disk to image (e.g. /dev/nvme1n1 or /dev/nvme1n1p1):"))
            : configured;
        if (device.empty()) {
            return ToolResult::failure("No disk given to image");
        }
        if (!imager->isBlockDevice(device)) {
            return ToolResult::failure("Not a block device: " + device);
        }
        return ToolResult::ok();
    };

    bool resumable = config.resumableImaging;
    step.action = [imager, resumable](const StepContext& ctx) {
        return imager->imageDevice(ctx.target, (fs::path(ctx.outputDir) / kDiskImageFile).string(), resumable);
    };
    registry.add(step);
}

void addSnapshotStep(StepRegistry& registry, const BackupConfig& config, const Collaborators& tools) {
    Step step;
    step.id = Job::kSnapshotMarker;
    step.description = "create a snapshot in the deduplicating repository";
    step.checksummed = false;
    step.sources = config.snapshotSources.empty()
        ? std::vector<std::string>{config.homeDir}
        : config.snapshotSources;
    step.destination = config.snapshotRepo.empty() ? Job::kSnapshotMarker : config.snapshotRepo;

    auto store = tools.snapshotStore;
    auto sources = step.sources;
    std::string repo = config.snapshotRepo;
    step.action = [store, sources, repo](const StepContext& ctx) {
        std::string archiveId;
        ToolResult result = store->create(repo.empty() ? ctx.outputDir : repo, sources, archiveId);
        if (result.success) {
            Logger::info("Snapshot " + archiveId + " created");
        }
        return result;
    };
    registry.add(step);
}

void addFinalizeSteps(StepRegistry& registry, const BackupConfig& config, const Collaborators& tools,
                      const Job& job) {
    if (config.archive) {
        Step compress;
        compress.id = "compress";
        compress.description = "compress the backup";
        compress.kind = StepKind::FINALIZE;
        compress.destination = job.archivePath();
        auto archiver = tools.archiver;
        compress.action = [archiver](const StepContext& ctx) {
            return archiver->archive(ctx.job.getPath(), ctx.job.archivePath());
        };
        registry.add(compress);
    }

    if (config.archive && config.encrypt) {
        Step encrypt;
        encrypt.id = "encrypt";
        encrypt.description = "encrypt the backup archive";
        encrypt.kind = StepKind::FINALIZE;
        encrypt.destination = job.encryptedArchivePath();
        encrypt.applicable = [&job]() {
            std::error_code ec;
            return fs::exists(job.archivePath(), ec) || fs::exists(job.encryptedArchivePath(), ec);
        };

        auto cipher = tools.cipher;
        std::string passphraseFile = config.passphraseFile;
        encrypt.action = [cipher, passphraseFile](const StepContext& ctx) {
            std::error_code ec;
            const Job& job = ctx.job;
            if (!fs::exists(job.archivePath(), ec)) {
                // A previous run encrypted and removed the archive before it could journal
                Logger::info("Archive already encrypted: " + job.encryptedArchivePath());
                return ToolResult::ok();
            }

            std::string passphrase;
            std::string error;
            if (!obtainPassphrase(passphraseFile, job.passphrasePath(), passphrase, error)) {
                return ToolResult::failure(error);
            }
            ToolResult result = cipher->encrypt(job.archivePath(), job.encryptedArchivePath(), passphrase);
            if (!result.success) {
                return result;
            }
            fs::remove(job.archivePath(), ec);
            if (ec) {
                Logger::warning("Failed to remove plaintext archive " + job.archivePath() + ": " + ec.message());
            }
            if (passphraseFile.empty()) {
                Logger::info("Encryption passphrase stored in " + job.passphrasePath() +
                             ", keep it safe. It is required to restore this backup.");
            }
            return ToolResult::ok();
        };
        registry.add(encrypt);
    }
}

} // namespace

bool obtainPassphrase(const std::string& passphraseFile, const std::string& storePath,
                      std::string& passphrase, std::string& error) {
    if (!passphraseFile.empty()) {
        std::ifstream file(passphraseFile);
        if (!file.is_open()) {
            error = "Failed to read passphrase file " + passphraseFile;
            return false;
        }
        std::getline(file, passphrase);
        passphrase = utils::trim(passphrase);
        if (passphrase.empty()) {
            error = "Passphrase file is empty: " + passphraseFile;
            return false;
        }
        return true;
    }

    // Reuse the passphrase of an interrupted encryption
    std::ifstream existing(storePath);
    if (existing.is_open() && std::getline(existing, passphrase) && !utils::trim(passphrase).empty()) {
        passphrase = utils::trim(passphrase);
        return true;
    }

    passphrase = OpenSSLCipher::generatePassphrase();
    if (passphrase.empty()) {
        error = "Failed to generate a passphrase";
        return false;
    }

    int fd = ::open(storePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        error = "Failed to create " + storePath + ": " + strerror(errno);
        return false;
    }
    std::string line = passphrase + "\n";
    bool written = ::write(fd, line.data(), line.size()) == static_cast<ssize_t>(line.size()) &&
                   ::fchmod(fd, 0600) == 0 && ::fsync(fd) == 0;
    int err = errno;
    ::close(fd);
    if (!written) {
        error = "Failed to write " + storePath + ": " + strerror(err);
        return false;
    }
    return true;
}

StepRegistry buildBackupPlan(const BackupConfig& config, const Collaborators& tools,
                             std::shared_ptr<ConfirmationGate> gate, const Job& job) {
    StepRegistry registry;
    switch (job.getMode()) {
        case BackupMode::SELECTIVE:
            addSelectiveSteps(registry, config, tools);
            addFinalizeSteps(registry, config, tools, job);
            break;
        case BackupMode::DISK_IMAGE:
            addDiskImageStep(registry, config, tools, gate);
            addFinalizeSteps(registry, config, tools, job);
            break;
        case BackupMode::SNAPSHOT_STORE:
            addSnapshotStep(registry, config, tools);
            break;
    }
    Logger::debug("Backup plan for " + toString(job.getMode()) + ": " + std::to_string(registry.size()) + " steps");
    return registry;
}
