#include "test_support.hpp"
#include "backup/backup_verifier.hpp"
#include "backup/checksum_manifest.hpp"
#include "backup/tools/openssl_cipher.hpp"

// A selective backup of ten files under etc/, journaled and manifested.
class BackupVerifierTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        job_ = std::make_unique<Job>(Job::create((root_ / "work").string(), BackupMode::SELECTIVE));
        for (int i = 0; i < 10; i++) {
            writeFile(fs::path(job_->stepPath("etc")) / ("file" + std::to_string(i)), "content " + std::to_string(i));
        }
        std::string error;
        ASSERT_TRUE(ChecksumManifest::commit(job_->getPath(), "etc", error)) << error;
        StateJournal((fs::path(job_->getPath()) / StateJournal::kBackupJournal).string()).append("etc", 1.0);

        archiver_ = std::make_shared<FakeArchiver>(root_ / "archives");
        snapshots_ = std::make_shared<FakeSnapshotStore>();
    }

    BackupVerifier verifier(VerifyOptions options = {}) {
        return BackupVerifier(archiver_, std::make_shared<OpenSSLCipher>(), snapshots_, options);
    }

    fs::path archivedStepDir() const {
        return archiver_->contentsOf(job_->archivePath()) / "etc";
    }

    std::unique_ptr<Job> job_;
    std::shared_ptr<FakeArchiver> archiver_;
    std::shared_ptr<FakeSnapshotStore> snapshots_;
};

TEST_F(BackupVerifierTest, MatchingArchivePasses) {
    ASSERT_TRUE(archiver_->archive(job_->getPath(), job_->archivePath()).success);
    VerificationResult result = verifier().verify(*job_);
    EXPECT_TRUE(result.success) << result.errorMessage;
}

TEST_F(BackupVerifierTest, ArchiveMissingAMemberIsAFileCountMismatch) {
    ASSERT_TRUE(archiver_->archive(job_->getPath(), job_->archivePath()).success);
    fs::remove(archivedStepDir() / "file3");

    VerificationResult result = verifier().verify(*job_);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "file count mismatch");
}

TEST_F(BackupVerifierTest, AlteredMemberIsAChecksumMismatch) {
    ASSERT_TRUE(archiver_->archive(job_->getPath(), job_->archivePath()).success);
    writeFile(archivedStepDir() / "file7", "tampered");

    VerificationResult result = verifier().verify(*job_);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "checksum mismatch");
}

TEST_F(BackupVerifierTest, MembersOutsideJournaledStepsAreNotCounted) {
    writeFile(fs::path(job_->stepPath("home")) / "unjournaled", "partial copy");
    ASSERT_TRUE(archiver_->archive(job_->getPath(), job_->archivePath()).success);

    EXPECT_TRUE(verifier().verify(*job_).success);
}

TEST_F(BackupVerifierTest, LiveTreeIsCheckedWhenNothingWasArchived) {
    EXPECT_TRUE(verifier().verify(*job_).success);

    writeFile(fs::path(job_->stepPath("etc")) / "file0", "changed after the backup");
    VerificationResult result = verifier().verify(*job_);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "checksum mismatch");
}

TEST_F(BackupVerifierTest, SymlinksInAnUntouchedBackupVerify) {
    fs::create_symlink("file0", fs::path(job_->stepPath("etc")) / "system-release");
    fs::create_directories(fs::path(job_->stepPath("etc")) / "alternatives");
    fs::create_symlink("../file1", fs::path(job_->stepPath("etc")) / "alternatives" / "editor");
    std::string error;
    ASSERT_TRUE(ChecksumManifest::commit(job_->getPath(), "etc", error)) << error;

    std::vector<ManifestEntry> entries;
    ASSERT_TRUE(ChecksumManifest::read(ChecksumManifest::pathFor(job_->getPath(), "etc"), entries, error));
    ASSERT_EQ(entries.size(), 12u);
    EXPECT_EQ(entries[0].relativePath, "etc/alternatives/editor");
    EXPECT_EQ(entries.back().relativePath, "etc/system-release");

    VerifyOptions liveTree;
    liveTree.useArchive = false;
    VerificationResult live = verifier(liveTree).verify(*job_);
    EXPECT_TRUE(live.success) << live.errorMessage;

    ASSERT_TRUE(archiver_->archive(job_->getPath(), job_->archivePath()).success);
    VerificationResult archived = verifier().verify(*job_);
    EXPECT_TRUE(archived.success) << archived.errorMessage;
}

TEST_F(BackupVerifierTest, EncryptedArchiveIsDecryptedWithTheStoredPassphrase) {
    ASSERT_TRUE(archiver_->archive(job_->getPath(), job_->archivePath()).success);
    OpenSSLCipher cipher;
    ASSERT_TRUE(cipher.encrypt(job_->archivePath(), job_->encryptedArchivePath(), "s3cret").success);
    fs::remove(job_->archivePath());
    writeFile(job_->passphrasePath(), "s3cret\n");

    EXPECT_TRUE(verifier().verify(*job_).success);

    fs::remove(archivedStepDir() / "file9");
    EXPECT_EQ(verifier().verify(*job_).errorMessage, "file count mismatch");
}

TEST_F(BackupVerifierTest, EncryptedArchiveWithoutPassphraseFails) {
    ASSERT_TRUE(archiver_->archive(job_->getPath(), job_->archivePath()).success);
    OpenSSLCipher cipher;
    ASSERT_TRUE(cipher.encrypt(job_->archivePath(), job_->encryptedArchivePath(), "s3cret").success);
    fs::remove(job_->archivePath());

    VerificationResult result = verifier().verify(*job_);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("No passphrase"), std::string::npos);
}

TEST_F(BackupVerifierTest, SnapshotJobsDelegateToTheStoreCheck) {
    job_->setMode(BackupMode::SNAPSHOT_STORE);
    EXPECT_TRUE(verifier().verify(*job_).success);

    snapshots_->checkPasses = false;
    VerificationResult result = verifier().verify(*job_);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("snapshot check failed"), std::string::npos);
}
