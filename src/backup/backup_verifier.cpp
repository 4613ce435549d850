#include "backup/backup_verifier.hpp"
#include "backup/checksum_manifest.hpp"
#include "backup/state_journal.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Scratch directory removed when it goes out of scope.
class TempDir {
public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "hostkeeper-verify-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data())) {
            path_ = buffer.data();
        }
    }
    ~TempDir() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    bool valid() const { return !path_.empty(); }
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::string firstComponent(const std::string& member) {
    auto slash = member.find('/');
    return slash == std::string::npos ? member : member.substr(0, slash);
}

} // namespace

BackupVerifier::BackupVerifier(std::shared_ptr<Archiver> archiver, std::shared_ptr<Cipher> cipher,
                               std::shared_ptr<SnapshotStore> snapshotStore, VerifyOptions options)
    : archiver_(std::move(archiver))
    , cipher_(std::move(cipher))
    , snapshotStore_(std::move(snapshotStore))
    , options_(std::move(options)) {
}

VerificationResult BackupVerifier::verify(const Job& job) {
    try {
        if (job.getMode() == BackupMode::SNAPSHOT_STORE) {
            return verifySnapshot(job);
        }

        ExpectedFiles expected;
        std::vector<std::string> stepIds;
        std::string error;
        if (!loadExpected(job, expected, stepIds, error)) {
            return {false, error};
        }
        Logger::info("Verifying " + std::to_string(expected.size()) + " files from " +
                     std::to_string(stepIds.size()) + " steps of " + job.getId());
        if (stepIds.empty()) {
            Logger::warning("No checksum manifests found for " + job.getId() + ", nothing to compare");
        }

        std::error_code ec;
        if (options_.useArchive && fs::exists(job.archivePath(), ec)) {
            return verifyArchive(job, job.archivePath(), expected, stepIds);
        }

        if (options_.useArchive && fs::exists(job.encryptedArchivePath(), ec)) {
            if (!cipher_) {
                return {false, "No cipher available to decrypt " + job.encryptedArchivePath()};
            }
            std::string passphrase = resolvePassphrase(job);
            if (passphrase.empty()) {
                return {false, "No passphrase available for " + job.encryptedArchivePath()};
            }
            TempDir scratch;
            if (!scratch.valid()) {
                return {false, "Failed to create temporary directory for verification"};
            }
            std::string plainArchive = (fs::path(scratch.path()) / (job.getId() + ".tar.gz")).string();
            ToolResult decrypted = cipher_->decrypt(job.encryptedArchivePath(), plainArchive, passphrase);
            if (!decrypted.success) {
                return {false, "Failed to decrypt archive: " + decrypted.errorMessage};
            }
            return verifyArchive(job, plainArchive, expected, stepIds);
        }

        return verifyTree(job.getPath(), expected, stepIds);
    } catch (const std::exception& e) {
        return {false, "Verification failed: " + std::string(e.what())};
    }
}

VerificationResult BackupVerifier::verifySnapshot(const Job& job) {
    if (!snapshotStore_) {
        return {false, "No snapshot store available"};
    }
    std::string repo = options_.snapshotRepo.empty()
        ? (fs::path(job.getPath()) / Job::kSnapshotMarker).string()
        : options_.snapshotRepo;
    ToolResult checked = snapshotStore_->check(repo);
    if (!checked.success) {
        Logger::warning("Snapshot repository check failed, manual inspection required: " + repo);
        return {false, "snapshot check failed: " + checked.errorMessage};
    }
    return {true, ""};
}

bool BackupVerifier::loadExpected(const Job& job, ExpectedFiles& expected,
                                  std::vector<std::string>& stepIds, std::string& error) {
    StateJournal journal((fs::path(job.getPath()) / options_.journalFile).string());
    ResumeState state = journal.load();

    std::error_code ec;
    for (const auto& stepId : state.done) {
        std::string manifestPath = ChecksumManifest::pathFor(job.getPath(), stepId);
        if (!fs::exists(manifestPath, ec)) {
            continue;  // finalize steps and the snapshot step
        }
        std::vector<ManifestEntry> entries;
        if (!ChecksumManifest::read(manifestPath, entries, error)) {
            return false;
        }
        for (const auto& entry : entries) {
            expected[entry.relativePath] = entry.checksum;
        }
        stepIds.push_back(stepId);
    }
    return true;
}

VerificationResult BackupVerifier::verifyArchive(const Job& job, const std::string& archivePath,
                                                 const ExpectedFiles& expected,
                                                 const std::vector<std::string>& stepIds) {
    if (!archiver_) {
        return {false, "No archiver available to inspect " + archivePath};
    }

    std::vector<std::string> members;
    ToolResult listed = archiver_->listMembers(archivePath, members);
    if (!listed.success) {
        return {false, "Failed to list archive: " + listed.errorMessage};
    }

    size_t counted = 0;
    for (auto member : members) {
        if (utils::startsWith(member, "./")) {
            member = member.substr(2);
        }
        if (member.empty() || member.back() == '/') {
            continue;
        }
        if (std::find(stepIds.begin(), stepIds.end(), firstComponent(member)) != stepIds.end()) {
            ++counted;
        }
    }

    if (counted != expected.size()) {
        Logger::error("Archive " + archivePath + " holds " + std::to_string(counted) +
                      " files, expected " + std::to_string(expected.size()));
        return {false, "file count mismatch"};
    }

    TempDir scratch;
    if (!scratch.valid()) {
        return {false, "Failed to create temporary directory for verification"};
    }
    ToolResult extracted = archiver_->extract(archivePath, scratch.path());
    if (!extracted.success) {
        return {false, "Failed to extract archive: " + extracted.errorMessage};
    }
    Logger::debug("Extracted " + job.getId() + " to " + scratch.path() + " for verification");
    return verifyTree(scratch.path(), expected, stepIds);
}

VerificationResult BackupVerifier::verifyTree(const std::string& root, const ExpectedFiles& expected,
                                              const std::vector<std::string>& stepIds) {
    size_t counted = 0;
    for (const auto& stepId : stepIds) {
        std::vector<ManifestEntry> actual;
        std::string error;
        if (!ChecksumManifest::build(root, stepId, actual, error)) {
            return {false, error};
        }
        counted += actual.size();
        for (const auto& entry : actual) {
            auto it = expected.find(entry.relativePath);
            if (it == expected.end()) {
                Logger::error("Unexpected file in backup: " + entry.relativePath);
                return {false, "file count mismatch"};
            }
            if (it->second != entry.checksum) {
                Logger::error("Checksum differs for " + entry.relativePath);
                return {false, "checksum mismatch"};
            }
        }
    }

    if (counted != expected.size()) {
        Logger::error("Found " + std::to_string(counted) + " files under " + root +
                      ", expected " + std::to_string(expected.size()));
        return {false, "file count mismatch"};
    }
    return {true, ""};
}

std::string BackupVerifier::resolvePassphrase(const Job& job) const {
    if (!options_.passphrase.empty()) {
        return options_.passphrase;
    }
    std::ifstream file(job.passphrasePath());
    std::string passphrase;
    if (file.is_open()) {
        std::getline(file, passphrase);
    }
    return utils::trim(passphrase);
}
