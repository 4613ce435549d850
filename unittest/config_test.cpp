#include "test_support.hpp"
#include "backup/backup_cli.hpp"
#include "backup/backup_config.hpp"
#include "backup/preflight.hpp"
#include "common/errors.hpp"
#include <cstdint>
#include <sstream>
#include <unistd.h>

TEST(BackupConfigTest, DefaultsMatchTheInteractiveScripts) {
    BackupConfig config = BackupConfig::fromJsonText("{}");
    EXPECT_EQ(config.workDir, ".");
    EXPECT_EQ(config.mode, BackupMode::SELECTIVE);
    EXPECT_EQ(config.requiredFreeKb, 52428800u);
    EXPECT_TRUE(config.archive);
    EXPECT_TRUE(config.encrypt);
    EXPECT_FALSE(config.continueOnError);
    EXPECT_FALSE(config.yesToAllCoversDestructive);
}

TEST(BackupConfigTest, ReadsEveryKey) {
    BackupConfig config = BackupConfig::fromJsonText(R"({
        "work_dir": "/srv/backups",
        "home_dir": "/home/alex",
        "mode": "disk-image",
        "use_sudo": true,
        "continue_on_error": true,
        "yes_to_all_covers_destructive": true,
        "archive": true,
        "encrypt": false,
        "passphrase_file": "/root/.hostkeeper-pass",
        "device": "/dev/nvme1n1",
        "resumable_imaging": true,
        "snapshot_repo": "/srv/borg",
        "snapshot_sources": ["/home", "/etc"],
        "restore_path": "/mnt/restore",
        "required_free_kb": 1024,
        "required_tools": ["lsblk"],
        "log_file": "/var/log/hostkeeper.log",
        "log_level": "debug",
        "comment": "unknown keys are ignored"
    })");

    EXPECT_EQ(config.workDir, "/srv/backups");
    EXPECT_EQ(config.homeDir, "/home/alex");
    EXPECT_EQ(config.mode, BackupMode::DISK_IMAGE);
    EXPECT_TRUE(config.useSudo);
    EXPECT_TRUE(config.continueOnError);
    EXPECT_TRUE(config.yesToAllCoversDestructive);
    EXPECT_FALSE(config.encrypt);
    EXPECT_EQ(config.passphraseFile, "/root/.hostkeeper-pass");
    EXPECT_EQ(config.device, "/dev/nvme1n1");
    EXPECT_TRUE(config.resumableImaging);
    EXPECT_EQ(config.snapshotRepo, "/srv/borg");
    EXPECT_EQ(config.snapshotSources, (std::vector<std::string>{"/home", "/etc"}));
    EXPECT_EQ(config.restorePath, "/mnt/restore");
    EXPECT_EQ(config.requiredFreeKb, 1024u);
    EXPECT_EQ(config.requiredTools, std::vector<std::string>{"lsblk"});
    EXPECT_EQ(config.logFile, "/var/log/hostkeeper.log");
    EXPECT_EQ(config.logLevel, "debug");
}

TEST(BackupConfigTest, WrongTypesAreConfigurationErrors) {
    EXPECT_THROW(BackupConfig::fromJsonText(R"({"use_sudo": "yes"})"), ConfigurationError);
    EXPECT_THROW(BackupConfig::fromJsonText(R"({"snapshot_sources": "/home"})"), ConfigurationError);
    EXPECT_THROW(BackupConfig::fromJsonText(R"({"mode": "incremental"})"), ConfigurationError);
    EXPECT_THROW(BackupConfig::fromJsonText(R"({"log_level": "chatty"})"), ConfigurationError);
    EXPECT_THROW(BackupConfig::fromJsonText("[1, 2]"), ConfigurationError);
    EXPECT_THROW(BackupConfig::fromJsonText("{not json"), ConfigurationError);
}

TEST(BackupConfigTest, MissingFileIsAConfigurationError) {
    EXPECT_THROW(BackupConfig::fromFile("/nonexistent/hostkeeper.json"), ConfigurationError);
}

class PreflightTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config_.workDir = root_.string();
        config_.requiredFreeKb = 1;
        packages_ = std::make_shared<FakePackageManager>();
    }

    BackupConfig config_;
    std::shared_ptr<FakePackageManager> packages_;
};

TEST_F(PreflightTest, ToolsDependOnTheMode) {
    EXPECT_EQ(Preflight::requiredTools(config_, BackupMode::SELECTIVE, false),
              (std::vector<std::string>{"rsync", "tar"}));
    EXPECT_EQ(Preflight::requiredTools(config_, BackupMode::SNAPSHOT_STORE, false),
              std::vector<std::string>{"borg"});
    EXPECT_EQ(Preflight::requiredTools(config_, BackupMode::DISK_IMAGE, true),
              (std::vector<std::string>{"ddrescue", "rsync", "tar"}));

    config_.resumableImaging = true;
    config_.requiredTools = {"lsblk"};
    EXPECT_EQ(Preflight::requiredTools(config_, BackupMode::DISK_IMAGE, false),
              (std::vector<std::string>{"ddrescue", "lsblk", "tar"}));
}

TEST_F(PreflightTest, DecliningToInstallMissingToolsAborts) {
    packages_->tools = {"tar"};
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::NO});
    Preflight preflight(config_, packages_, gate);

    EXPECT_THROW(preflight.checkTools({"rsync", "tar"}), ConfigurationError);
    EXPECT_TRUE(packages_->installRequests.empty());
}

TEST_F(PreflightTest, AcceptedInstallationResolvesMissingTools) {
    packages_->tools = {"tar"};
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::YES});
    Preflight preflight(config_, packages_, gate);

    EXPECT_NO_THROW(preflight.checkTools({"rsync", "tar"}));
    ASSERT_EQ(packages_->installRequests.size(), 1u);
    EXPECT_EQ(packages_->installRequests[0].name, "rsync");
    EXPECT_EQ(packages_->installRequests[0].source, PackageSource::RPM);
}

TEST_F(PreflightTest, InsufficientSpaceAborts) {
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{});
    Preflight preflight(config_, packages_, gate);

    EXPECT_NO_THROW(preflight.checkDiskSpace(root_.string(), 1));
    EXPECT_THROW(preflight.checkDiskSpace(root_.string(), UINT64_MAX / 2048), ConfigurationError);
}

TEST_F(PreflightTest, RestoreNeedsRootOrSudo) {
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{});
    Preflight preflight(config_, packages_, gate);
    EXPECT_NO_THROW(preflight.checkPrivileges(false));

    if (geteuid() == 0) {
        EXPECT_NO_THROW(preflight.checkPrivileges(true));
    } else {
        EXPECT_THROW(preflight.checkPrivileges(true), ConfigurationError);
        config_.useSudo = true;
        EXPECT_NO_THROW(preflight.checkPrivileges(true));
    }
}

TEST(BackupCLITest, ParsesFlags) {
    const char* args[] = {"--mode", "snapshot", "--job", "/srv/backup_20240101_000000", "--yes",
                          "--confirm-target", "/dev/sdb", "--continue-on-error", "--cleanup-on-failure"};
    CommandOptions options = BackupCLI::parseOptions(9, const_cast<char**>(args));

    EXPECT_EQ(options.mode, "snapshot");
    EXPECT_EQ(options.jobDir, "/srv/backup_20240101_000000");
    EXPECT_TRUE(options.assumeYes);
    EXPECT_EQ(options.confirmedTargets, std::set<std::string>{"/dev/sdb"});
    EXPECT_TRUE(options.continueOnError);
    EXPECT_TRUE(options.cleanupOnFailure);
}

TEST(BackupCLITest, RejectsUnknownFlagsAndMissingValues) {
    const char* unknown[] = {"--frobnicate"};
    EXPECT_THROW(BackupCLI::parseOptions(1, const_cast<char**>(unknown)), ConfigurationError);

    const char* missing[] = {"--job"};
    EXPECT_THROW(BackupCLI::parseOptions(1, const_cast<char**>(missing)), ConfigurationError);
}

TEST(BackupCLITest, YesBecomesAYesToAllPolicy) {
    BackupConfig config;
    CommandOptions options;
    options.assumeYes = true;

    OrchestratorOptions restore = BackupCLI::orchestratorOptionsFor(config, options, true);
    EXPECT_TRUE(restore.policy.allRemaining);
    EXPECT_FALSE(restore.policy.yesToAllCoversDestructive);
    EXPECT_EQ(restore.reportFile, "restore_report.txt");

    Step restoreEtc;
    restoreEtc.id = "restore_etc";
    restoreEtc.destructive = true;
    EXPECT_FALSE(restore.policy.covers(restoreEtc));

    config.yesToAllCoversDestructive = true;
    EXPECT_TRUE(BackupCLI::orchestratorOptionsFor(config, options, false).policy.covers(restoreEtc));

    options.assumeYes = false;
    EXPECT_FALSE(BackupCLI::orchestratorOptionsFor(config, options, false).policy.allRemaining);
}

class BackupCLIRunTest : public TempDirTest {};

TEST_F(BackupCLIRunTest, StatusPrintsBothJournals) {
    Job job = Job::create((root_ / "work").string(), BackupMode::SELECTIVE);
    StateJournal((fs::path(job.getPath()) / StateJournal::kBackupJournal).string()).append("etc", 4.0);
    StateJournal((fs::path(job.getPath()) / StateJournal::kRestoreJournal).string()).append("extract", 2.0);

    std::ostringstream out;
    std::ostringstream err;
    BackupCLI cli([](const BackupConfig&) { return Collaborators{}; },
                  std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{}), out, err);

    std::string jobPath = job.getPath();
    const char* args[] = {"hostkeeper", "status", "--job", jobPath.c_str()};
    EXPECT_EQ(cli.run(4, const_cast<char**>(args)), 0);
    EXPECT_NE(out.str().find("Mode:  selective"), std::string::npos);
    EXPECT_NE(out.str().find("Backup journal (1 steps):\n  etc  4.0s"), std::string::npos);
    EXPECT_NE(out.str().find("Restore journal (1 steps):\n  extract  2.0s"), std::string::npos);
}

TEST_F(BackupCLIRunTest, UnknownJobExitsWithFailure) {
    std::ostringstream out;
    std::ostringstream err;
    BackupCLI cli([](const BackupConfig&) { return Collaborators{}; },
                  std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{}), out, err);

    std::string missing = (root_ / "backup_19990101_000000").string();
    const char* args[] = {"hostkeeper", "verify", "--job", missing.c_str()};
    EXPECT_EQ(cli.run(4, const_cast<char**>(args)), 1);
    EXPECT_NE(err.str().find("Job not found"), std::string::npos);
}
