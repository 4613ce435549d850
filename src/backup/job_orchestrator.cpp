#include "backup/job_orchestrator.hpp"
#include "backup/checksum_manifest.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/job_lock.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

const char* kSealingStep = "compress";
const char* kEncryptStep = "encrypt";

StepRecord makeRecord(const Step& step, StepOutcome outcome) {
    StepRecord record;
    record.stepId = step.id;
    record.description = step.description;
    record.outcome = outcome;
    return record;
}

} // namespace

JobOrchestrator::JobOrchestrator(std::shared_ptr<ConfirmationGate> gate,
                                 std::shared_ptr<StateJournal> journal,
                                 std::shared_ptr<BackupVerifier> verifier,
                                 OrchestratorOptions options)
    : gate_(std::move(gate))
    , journal_(std::move(journal))
    , verifier_(std::move(verifier))
    , options_(std::move(options))
    , policy_(options_.policy) {
}

RunReport JobOrchestrator::run(Job& job, const StepRegistry& registry, const ResumeState& resumeState) {
    JobLock lock(job.lockPath());

    RunReport report;
    report.begin(std::chrono::system_clock::now());
    policy_ = options_.policy;
    sealed_ = resumeState.contains(kSealingStep);

    Logger::info("Running " + std::to_string(registry.size()) + " steps for job " + job.getPath() +
                 " (" + std::to_string(resumeState.done.size()) + " already done)");
    job.setPhase(Job::Phase::RUNNING);

    for (const auto& step : registry.steps()) {
        checkCancelled(job, "", report);
        runStep(job, step, resumeState, report);
        writeReport(job, report);
    }

    job.refreshMode();
    if (options_.verify && verifier_) {
        VerificationResult result = verifier_->verify(job);
        report.setVerification(result.success, result.errorMessage);
        if (result.success) {
            Logger::info("Verification of " + job.getId() + " passed");
        } else {
            Logger::warning("Verification of " + job.getId() + " failed: " + result.errorMessage);
        }
    }

    if (job.getPhase() == Job::Phase::RUNNING) {
        job.setPhase(Job::Phase::COMPLETED);
    }
    report.finish(std::chrono::system_clock::now());
    writeReport(job, report);
    return report;
}

void JobOrchestrator::runStep(Job& job, const Step& step, const ResumeState& resumeState, RunReport& report) {
    if (resumeState.contains(step.id)) {
        Logger::info("Skipping " + step.id + ", already done");
        StepRecord record = makeRecord(step, StepOutcome::ALREADY_DONE);
        auto duration = resumeState.durations.find(step.id);
        if (duration != resumeState.durations.end()) {
            record.hasDuration = true;
            record.durationSeconds = duration->second;
        }
        report.record(record);
        return;
    }

    if (sealed_ && step.kind == StepKind::CAPTURE) {
        Logger::info("Skipping " + step.id + ", job is already archived");
        report.record(makeRecord(step, StepOutcome::SEALED));
        return;
    }

    if (!step.isApplicable()) {
        Logger::debug("Step " + step.id + " does not apply");
        report.record(makeRecord(step, StepOutcome::NOT_APPLICABLE));
        return;
    }

    if (policy_.covers(step)) {
        Logger::info("Proceeding with " + step.id + " (yes to all)");
    } else {
        Decision decision = gate_->ask("Do you want to " + step.description + "?");
        checkCancelled(job, "", report);
        if (decision == Decision::NO) {
            Logger::info("Skipping " + step.id + ", declined by operator");
            report.record(makeRecord(step, StepOutcome::DECLINED));
            return;
        }
        if (decision == Decision::YES_TO_ALL) {
            Logger::info("Yes to all remaining steps");
            policy_.allRemaining = true;
        }
    }

    StepContext context{job, "", ""};
    if (step.hasTarget()) {
        ToolResult resolved = step.resolveTarget(context.target);
        if (!resolved.success) {
            handleFailure(job, step, resolved.errorMessage, 0.0, report);
            return;
        }
        if (step.destructive) {
            bool confirmed = gate_->confirmTarget(
                "This will overwrite " + context.target + " and cannot be undone.", context.target);
            if (!confirmed) {
                Logger::warning("Skipping " + step.id + ", target " + context.target + " not confirmed");
                StepRecord record = makeRecord(step, StepOutcome::DECLINED);
                record.detail = "target not confirmed";
                report.record(record);
                return;
            }
        }
    }

    if (step.kind == StepKind::CAPTURE) {
        context.outputDir = job.stepPath(step.id);
        std::error_code ec;
        fs::create_directories(context.outputDir, ec);
        if (ec) {
            handleFailure(job, step, "Failed to create " + context.outputDir + ": " + ec.message(), 0.0, report);
            return;
        }
    }

    Logger::info("Starting " + step.id + ": " + step.description);
    auto start = std::chrono::steady_clock::now();
    ToolResult result;
    try {
        result = step.action(context);
    } catch (const std::exception& e) {
        result = ToolResult::failure(e.what());
    }
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (Cancellation::isRequested()) {
        ErrorLog(job.errorLogPath()).append(step.id, "interrupted by operator");
        StepRecord record = makeRecord(step, StepOutcome::CANCELLED);
        record.hasDuration = true;
        record.durationSeconds = seconds;
        report.record(record);
        checkCancelled(job, step.id, report);
    }

    if (!result.success) {
        handleFailure(job, step, result.errorMessage, seconds, report);
        return;
    }

    if (step.kind == StepKind::CAPTURE && step.checksummed) {
        std::string error;
        if (!ChecksumManifest::commit(job.getPath(), step.id, error)) {
            handleFailure(job, step, error, seconds, report);
            return;
        }
    }

    try {
        journal_->append(step.id, seconds);
    } catch (const OrchestrationError& e) {
        ErrorLog(job.errorLogPath()).append(step.id, e.what());
        StepRecord record = makeRecord(step, StepOutcome::FAILED);
        record.detail = e.what();
        report.record(record);
        job.setPhase(Job::Phase::FAILED);
        writeReport(job, report);
        throw StepExecutionError(step.id, e.what());
    }

    Logger::info(step.id + ": completed in " + std::to_string(static_cast<long>(seconds)) + " seconds");
    StepRecord record = makeRecord(step, StepOutcome::COMPLETED);
    record.hasDuration = true;
    record.durationSeconds = seconds;
    report.record(record);

    if (step.id == kSealingStep) {
        sealed_ = true;
        job.setPhase(Job::Phase::ARCHIVED);
    } else if (step.id == kEncryptStep) {
        job.setPhase(Job::Phase::ENCRYPTED);
    }
}

void JobOrchestrator::handleFailure(Job& job, const Step& step, const std::string& cause, double seconds,
                                    RunReport& report) {
    Logger::error("Step " + step.id + " failed: " + cause);
    ErrorLog(job.errorLogPath()).append(step.id, cause);

    StepRecord record = makeRecord(step, StepOutcome::FAILED);
    record.detail = cause;
    if (seconds > 0.0) {
        record.hasDuration = true;
        record.durationSeconds = seconds;
    }
    report.record(record);

    if (options_.continueOnError && !step.destructive) {
        Logger::warning("Continuing after failure of " + step.id);
        return;
    }

    job.setPhase(Job::Phase::FAILED);
    writeReport(job, report);
    throw StepExecutionError(step.id, cause);
}

void JobOrchestrator::checkCancelled(Job& job, const std::string& stepId, RunReport& report) {
    if (!Cancellation::isRequested()) {
        return;
    }
    Logger::warning("Interrupted, job can be resumed from " + job.getPath());
    job.setPhase(Job::Phase::CANCELLED);
    report.finish(std::chrono::system_clock::now());
    writeReport(job, report);
    throw JobCancelledError(stepId);
}

void JobOrchestrator::writeReport(const Job& job, const RunReport& report) const {
    std::string path = (fs::path(job.getPath()) / options_.reportFile).string();
    if (!report.writeTo(path, options_.reportTitle + " for " + job.getId())) {
        Logger::warning("Report could not be written to " + path);
    }
}
