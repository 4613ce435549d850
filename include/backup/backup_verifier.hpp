#pragma once

#include "backup/collaborators.hpp"
#include "common/job.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

struct VerificationResult {
    bool success;
    std::string errorMessage;
};

struct VerifyOptions {
    std::string journalFile{"state.log"};   // which journal decides the expected steps
    bool useArchive{true};                  // false: always check the live job directory
    std::string passphrase;                 // for <job>.tar.gz.enc; <job>.passphrase otherwise
    std::string snapshotRepo;               // default <job>/snapshot
};

// Checks a finished job against the checksum manifests of its journaled
// steps. Failures are reported in the result, never thrown.
class BackupVerifier {
public:
    BackupVerifier(std::shared_ptr<Archiver> archiver, std::shared_ptr<Cipher> cipher,
                   std::shared_ptr<SnapshotStore> snapshotStore, VerifyOptions options = {});
    virtual ~BackupVerifier() = default;

    virtual VerificationResult verify(const Job& job);

    const VerifyOptions& getOptions() const { return options_; }

private:
    using ExpectedFiles = std::map<std::string, std::string>;  // relative path -> digest

    VerificationResult verifySnapshot(const Job& job);
    VerificationResult verifyArchive(const Job& job, const std::string& archivePath,
                                     const ExpectedFiles& expected, const std::vector<std::string>& stepIds);
    VerificationResult verifyTree(const std::string& root, const ExpectedFiles& expected,
                                  const std::vector<std::string>& stepIds);

    bool loadExpected(const Job& job, ExpectedFiles& expected, std::vector<std::string>& stepIds,
                      std::string& error);
    std::string resolvePassphrase(const Job& job) const;

    std::shared_ptr<Archiver> archiver_;
    std::shared_ptr<Cipher> cipher_;
    std::shared_ptr<SnapshotStore> snapshotStore_;
    VerifyOptions options_;
};
