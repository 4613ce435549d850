#include "test_support.hpp"
#include "backup/checksum_manifest.hpp"
#include "backup/job_orchestrator.hpp"
#include "common/checksum.hpp"
#include "common/errors.hpp"
#include "common/job_lock.hpp"
#include <algorithm>
#include <ctime>

namespace {

std::chrono::system_clock::time_point newYear2024() {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 0;
    tm.tm_mday = 1;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

} // namespace

class OrchestratorTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        job_ = std::make_unique<Job>(Job::create((root_ / "work").string(), BackupMode::SELECTIVE));
        journalPath_ = (fs::path(job_->getPath()) / StateJournal::kBackupJournal).string();
    }

    Step recordingStep(const std::string& id, bool destructive = false) {
        Step step;
        step.id = id;
        step.description = "back up " + id;
        step.destructive = destructive;
        step.action = [this, id](const StepContext& ctx) {
            executed_.push_back(id);
            if (!ctx.outputDir.empty()) {
                writeFile(fs::path(ctx.outputDir) / (id + ".txt"), "data of " + id);
            }
            return ToolResult::ok();
        };
        return step;
    }

    Step failingStep(const std::string& id, bool destructive = false) {
        Step step;
        step.id = id;
        step.description = "back up " + id;
        step.destructive = destructive;
        step.action = [this, id](const StepContext&) {
            executed_.push_back(id);
            return ToolResult::failure("boom");
        };
        return step;
    }

    StepRegistry registryOf(std::initializer_list<Step> steps) {
        StepRegistry registry;
        for (const auto& step : steps) {
            registry.add(step);
        }
        return registry;
    }

    RunReport runWith(std::shared_ptr<ConfirmationGate> gate, const StepRegistry& registry,
                      OrchestratorOptions options = {}) {
        auto journal = std::make_shared<StateJournal>(journalPath_);
        JobOrchestrator orchestrator(gate, journal, nullptr, options);
        return orchestrator.run(*job_, registry, journal->load());
    }

    std::set<std::string> journaled() const {
        return StateJournal(journalPath_).load().done;
    }

    std::unique_ptr<Job> job_;
    std::string journalPath_;
    std::vector<std::string> executed_;
};

TEST_F(OrchestratorTest, ResumeSkipsJournaledStepsWithoutPrompting) {
    StateJournal(journalPath_).append("a", 1.0);
    StateJournal(journalPath_).append("b", 2.0);

    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::YES});
    RunReport report = runWith(gate, registryOf({recordingStep("a"), recordingStep("b"), recordingStep("c")}));

    EXPECT_EQ(executed_, std::vector<std::string>{"c"});
    ASSERT_EQ(gate->prompts().size(), 1u);
    EXPECT_EQ(gate->prompts()[0], "Do you want to back up c?");
    EXPECT_EQ(report.find("a")->outcome, StepOutcome::ALREADY_DONE);
    EXPECT_EQ(report.find("b")->outcome, StepOutcome::ALREADY_DONE);
    EXPECT_EQ(report.find("c")->outcome, StepOutcome::COMPLETED);
}

TEST_F(OrchestratorTest, SecondRunIsANoOp) {
    auto first = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES, Decision::YES});
    runWith(first, registryOf({recordingStep("a"), recordingStep("b")}));
    ASSERT_EQ(executed_.size(), 2u);

    auto second = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{});
    runWith(second, registryOf({recordingStep("a"), recordingStep("b")}));

    EXPECT_EQ(executed_.size(), 2u);
    EXPECT_TRUE(second->prompts().empty());
    EXPECT_EQ(journaled(), (std::set<std::string>{"a", "b"}));

    std::string contents = readFile(journalPath_);
    EXPECT_EQ(std::count(contents.begin(), contents.end(), '\n'), 2);
}

TEST_F(OrchestratorTest, CrashBeforeJournalAppendReexecutesStepOnResume) {
    auto journal = std::make_shared<CrashingJournal>(journalPath_);
    journal->crashOn = "b";
    journal->crashPoint = CrashingJournal::CrashPoint::BEFORE_WRITE;

    auto gate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES_TO_ALL});
    JobOrchestrator orchestrator(gate, journal, nullptr);
    auto registry = registryOf({recordingStep("a"), recordingStep("b"), recordingStep("c")});
    EXPECT_THROW(orchestrator.run(*job_, registry, journal->load()), StepExecutionError);

    EXPECT_EQ(journaled(), std::set<std::string>{"a"});
    EXPECT_EQ(executed_, (std::vector<std::string>{"a", "b"}));

    executed_.clear();
    auto resumeGate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES_TO_ALL});
    runWith(resumeGate, registry);

    EXPECT_EQ(executed_, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(journaled(), (std::set<std::string>{"a", "b", "c"}));
}

TEST_F(OrchestratorTest, CrashAfterJournalAppendNeverReexecutesStep) {
    auto journal = std::make_shared<CrashingJournal>(journalPath_);
    journal->crashOn = "b";
    journal->crashPoint = CrashingJournal::CrashPoint::AFTER_WRITE;

    auto gate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES_TO_ALL});
    JobOrchestrator orchestrator(gate, journal, nullptr);
    auto registry = registryOf({recordingStep("a"), recordingStep("b"), recordingStep("c")});
    EXPECT_THROW(orchestrator.run(*job_, registry, journal->load()), StepExecutionError);
    EXPECT_EQ(journaled(), (std::set<std::string>{"a", "b"}));

    executed_.clear();
    auto resumeGate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES_TO_ALL});
    runWith(resumeGate, registry);

    EXPECT_EQ(executed_, std::vector<std::string>{"c"});
    std::string contents = readFile(journalPath_);
    EXPECT_EQ(std::count(contents.begin(), contents.end(), '\n'), 3);
}

TEST_F(OrchestratorTest, DeclinedStepIsAskedAgainOnNextRun) {
    auto first = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::NO});
    RunReport report = runWith(first, registryOf({recordingStep("a")}));
    EXPECT_TRUE(executed_.empty());
    EXPECT_TRUE(journaled().empty());
    EXPECT_EQ(report.find("a")->outcome, StepOutcome::DECLINED);

    auto second = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::YES});
    runWith(second, registryOf({recordingStep("a")}));
    EXPECT_EQ(second->prompts().size(), 1u);
    EXPECT_EQ(executed_, std::vector<std::string>{"a"});
    EXPECT_EQ(journaled(), std::set<std::string>{"a"});
}

TEST_F(OrchestratorTest, YesToAllCoversOnlyTheRemainingSteps) {
    auto gate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::NO, Decision::YES_TO_ALL});
    runWith(gate, registryOf({recordingStep("a"), recordingStep("b"), recordingStep("c")}));

    EXPECT_EQ(gate->prompts().size(), 2u);
    EXPECT_EQ(executed_, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(journaled(), (std::set<std::string>{"b", "c"}));
}

TEST_F(OrchestratorTest, DestructiveStepIsAskedDespiteYesToAll) {
    Step restore = recordingStep("restore_etc", true);
    restore.kind = StepKind::RESTORE;

    auto gate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES_TO_ALL, Decision::NO});
    runWith(gate, registryOf({recordingStep("a"), restore}));

    EXPECT_EQ(gate->prompts().size(), 2u);
    EXPECT_EQ(executed_, std::vector<std::string>{"a"});
    EXPECT_EQ(journaled(), std::set<std::string>{"a"});
}

TEST_F(OrchestratorTest, UnattendedRunStillAsksBeforeDestructiveSteps) {
    Step restore = recordingStep("restore_etc", true);
    restore.kind = StepKind::RESTORE;

    // No operator at the console: every question reads EOF and answers no
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{});
    OrchestratorOptions options;
    options.policy.allRemaining = true;
    RunReport report = runWith(gate, registryOf({recordingStep("a"), restore, recordingStep("b")}), options);

    EXPECT_EQ(gate->prompts(), std::vector<std::string>{"Do you want to back up restore_etc?"});
    EXPECT_EQ(executed_, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(report.find("restore_etc")->outcome, StepOutcome::DECLINED);
}

TEST_F(OrchestratorTest, UnattendedRunCoversDestructiveStepsWhenConfigured) {
    Step restore = recordingStep("restore_etc", true);
    restore.kind = StepKind::RESTORE;

    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{});
    OrchestratorOptions options;
    options.policy.allRemaining = true;
    options.policy.yesToAllCoversDestructive = true;
    runWith(gate, registryOf({restore}), options);

    EXPECT_TRUE(gate->prompts().empty());
    EXPECT_EQ(executed_, std::vector<std::string>{"restore_etc"});
}

TEST_F(OrchestratorTest, UnknownJournalIdsAreIgnored) {
    StateJournal(journalPath_).append("obsolete_step", 7.0);
    StateJournal(journalPath_).append("a", 1.0);

    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::YES});
    RunReport report = runWith(gate, registryOf({recordingStep("a"), recordingStep("b")}));

    EXPECT_EQ(report.find("obsolete_step"), nullptr);
    ASSERT_EQ(report.records().size(), 2u);
    EXPECT_EQ(report.find("a")->outcome, StepOutcome::ALREADY_DONE);
    EXPECT_EQ(report.find("b")->outcome, StepOutcome::COMPLETED);
    EXPECT_EQ(executed_, std::vector<std::string>{"b"});
    EXPECT_EQ(journaled(), (std::set<std::string>{"obsolete_step", "a", "b"}));
    EXPECT_EQ(job_->getPhase(), Job::Phase::COMPLETED);
}

TEST_F(OrchestratorTest, DeniedTargetConfirmationSkipsDestructiveStep) {
    Step restore = recordingStep("restore_disk_image", true);
    restore.kind = StepKind::RESTORE;
    restore.resolveTarget = [](std::string& target) {
        target = "/dev/sdz";
        return ToolResult::ok();
    };

    OrchestratorOptions options;
    options.policy.yesToAllCoversDestructive = true;
    auto gate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES_TO_ALL}, std::vector<bool>{false});
    RunReport report = runWith(gate, registryOf({recordingStep("a"), restore}), options);

    EXPECT_EQ(executed_, std::vector<std::string>{"a"});
    EXPECT_EQ(report.find("restore_disk_image")->outcome, StepOutcome::DECLINED);
    EXPECT_FALSE(journaled().count("restore_disk_image"));
    EXPECT_TRUE(gate->confirmedTargets().empty());
}

TEST_F(OrchestratorTest, ConfirmedTargetIsPassedToTheAction) {
    Step restore;
    restore.id = "restore_snapshot";
    restore.description = "restore the latest snapshot";
    restore.kind = StepKind::RESTORE;
    restore.destructive = true;
    restore.resolveTarget = [](std::string& target) {
        target = "/srv/restore";
        return ToolResult::ok();
    };
    std::string seenTarget;
    restore.action = [&seenTarget](const StepContext& ctx) {
        seenTarget = ctx.target;
        return ToolResult::ok();
    };

    auto gate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES}, std::vector<bool>{true});
    runWith(gate, registryOf({restore}));

    EXPECT_EQ(seenTarget, "/srv/restore");
    EXPECT_EQ(gate->confirmedTargets(), std::vector<std::string>{"/srv/restore"});
    EXPECT_TRUE(journaled().count("restore_snapshot"));
}

TEST_F(OrchestratorTest, FailureIsLoggedAndStopsTheRun) {
    auto gate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES_TO_ALL});
    auto registry = registryOf({recordingStep("a"), failingStep("b"), recordingStep("c")});

    try {
        runWith(gate, registry);
        FAIL() << "expected StepExecutionError";
    } catch (const StepExecutionError& e) {
        EXPECT_EQ(e.stepId(), "b");
        EXPECT_EQ(e.cause(), "boom");
    }

    EXPECT_EQ(executed_, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(journaled(), std::set<std::string>{"a"});
    EXPECT_NE(readFile(job_->errorLogPath()).find("[b] Error: boom"), std::string::npos);
    EXPECT_NE(readFile(fs::path(job_->getPath()) / "report.txt").find("b (back up b): failed"), std::string::npos);
    EXPECT_EQ(Job::open(job_->getPath()).getPhase(), Job::Phase::FAILED);
}

TEST_F(OrchestratorTest, ContinueOnErrorKeepsGoingAfterNonDestructiveFailure) {
    OrchestratorOptions options;
    options.continueOnError = true;
    auto gate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES_TO_ALL});
    RunReport report = runWith(gate, registryOf({failingStep("a"), recordingStep("b")}), options);

    EXPECT_EQ(report.find("a")->outcome, StepOutcome::FAILED);
    EXPECT_EQ(report.find("b")->outcome, StepOutcome::COMPLETED);
    EXPECT_EQ(journaled(), std::set<std::string>{"b"});
    EXPECT_NE(readFile(job_->errorLogPath()).find("[a]"), std::string::npos);
}

TEST_F(OrchestratorTest, DestructiveFailureIsFatalEvenWhenContinuingOnError) {
    OrchestratorOptions options;
    options.continueOnError = true;
    Step restore = failingStep("restore_etc", true);
    restore.kind = StepKind::RESTORE;
    auto gate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES, Decision::YES});

    EXPECT_THROW(runWith(gate, registryOf({restore, recordingStep("b")}), options), StepExecutionError);
    EXPECT_TRUE(executed_.size() == 1 && executed_[0] == "restore_etc");
}

TEST_F(OrchestratorTest, InterruptNeverJournalsTheInFlightStep) {
    Step slow;
    slow.id = "b";
    slow.description = "back up b";
    slow.action = [](const StepContext&) {
        Cancellation::request();
        return ToolResult::ok();
    };

    auto gate = std::make_shared<ScriptedConfirmationGate>(
        std::vector<Decision>{Decision::YES_TO_ALL});
    EXPECT_THROW(runWith(gate, registryOf({recordingStep("a"), slow, recordingStep("c")})), JobCancelledError);

    EXPECT_EQ(journaled(), std::set<std::string>{"a"});
    EXPECT_EQ(executed_, std::vector<std::string>{"a"});
    EXPECT_EQ(Job::open(job_->getPath()).getPhase(), Job::Phase::CANCELLED);
    EXPECT_NE(readFile(fs::path(job_->getPath()) / "report.txt").find("cancelled"), std::string::npos);
}

TEST_F(OrchestratorTest, InapplicableStepIsNeitherAskedNorJournaled) {
    Step missing = recordingStep("mozilla");
    missing.applicable = []() { return false; };
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::YES});
    RunReport report = runWith(gate, registryOf({missing, recordingStep("b")}));

    EXPECT_EQ(gate->prompts().size(), 1u);
    EXPECT_EQ(report.find("mozilla")->outcome, StepOutcome::NOT_APPLICABLE);
    EXPECT_EQ(journaled(), std::set<std::string>{"b"});
}

TEST_F(OrchestratorTest, SealedJobSkipsCaptureSteps) {
    StateJournal(journalPath_).append("compress", 3.0);

    Step encrypt = recordingStep("encrypt");
    encrypt.kind = StepKind::FINALIZE;
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::YES});
    RunReport report = runWith(gate, registryOf({recordingStep("a"), recordingStep("compress"), encrypt}));

    EXPECT_EQ(report.find("a")->outcome, StepOutcome::SEALED);
    EXPECT_EQ(executed_, std::vector<std::string>{"encrypt"});
}

TEST_F(OrchestratorTest, ManifestIsCommittedWithTheStep) {
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::YES});
    runWith(gate, registryOf({recordingStep("a")}));

    std::vector<ManifestEntry> entries;
    std::string error;
    ASSERT_TRUE(ChecksumManifest::read(ChecksumManifest::pathFor(job_->getPath(), "a"), entries, error)) << error;
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].relativePath, "a/a.txt");
    EXPECT_EQ(entries[0].checksum, Checksum::sha256("data of a"));
}

TEST_F(OrchestratorTest, LockedJobIsRejected) {
    JobLock held(job_->lockPath());
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::YES});
    EXPECT_THROW(runWith(gate, registryOf({recordingStep("a")})), JobLockedError);
    EXPECT_TRUE(executed_.empty());
}

TEST_F(OrchestratorTest, VerifierResultIsRecordedInTheReport) {
    class FailingVerifier : public BackupVerifier {
    public:
        FailingVerifier() : BackupVerifier(nullptr, nullptr, nullptr) {}
        VerificationResult verify(const Job&) override { return {false, "file count mismatch"}; }
    };

    auto journal = std::make_shared<StateJournal>(journalPath_);
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::YES});
    JobOrchestrator orchestrator(gate, journal, std::make_shared<FailingVerifier>());
    RunReport report = orchestrator.run(*job_, registryOf({recordingStep("a")}), journal->load());

    EXPECT_TRUE(report.verificationRan());
    EXPECT_FALSE(report.verificationSucceeded());
    EXPECT_EQ(report.verificationMessage(), "file count mismatch");
    EXPECT_EQ(journaled(), std::set<std::string>{"a"});
}

class ResumeScenarioTest : public TempDirTest {};

TEST_F(ResumeScenarioTest, ResumingPromptsOnlyForUnfinishedSteps) {
    Job job = Job::create((root_ / "work").string(), BackupMode::SELECTIVE, newYear2024());
    ASSERT_EQ(job.getId(), "backup_20240101_000000");

    std::string journalPath = (fs::path(job.getPath()) / StateJournal::kBackupJournal).string();
    StateJournal(journalPath).append("etc", 42.0);

    std::vector<std::string> executed;
    StepRegistry registry;
    for (const char* id : {"etc", "home"}) {
        Step step;
        step.id = id;
        step.description = std::string("back up ") + id;
        step.action = [&executed, id](const StepContext& ctx) {
            executed.push_back(id);
            writeFile(fs::path(ctx.outputDir) / "file", id);
            return ToolResult::ok();
        };
        registry.add(step);
    }

    auto journal = std::make_shared<StateJournal>(journalPath);
    auto gate = std::make_shared<ScriptedConfirmationGate>(std::vector<Decision>{Decision::YES});
    JobOrchestrator orchestrator(gate, journal, nullptr);
    Job resumed = Job::open(job.getPath());
    RunReport report = orchestrator.run(resumed, registry, journal->load());

    EXPECT_EQ(gate->prompts(), std::vector<std::string>{"Do you want to back up home?"});
    EXPECT_EQ(executed, std::vector<std::string>{"home"});
    EXPECT_EQ(journal->load().done, (std::set<std::string>{"etc", "home"}));
    EXPECT_EQ(report.durationEntryCount(), 2u);

    std::string rendered = readFile(fs::path(job.getPath()) / "report.txt");
    EXPECT_NE(rendered.find("etc (back up etc): already done in 42.0 seconds"), std::string::npos);
    EXPECT_NE(rendered.find("home (back up home): completed in"), std::string::npos);
}
