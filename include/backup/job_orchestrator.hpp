#pragma once

#include "backup/backup_verifier.hpp"
#include "backup/confirmation_gate.hpp"
#include "backup/run_report.hpp"
#include "backup/state_journal.hpp"
#include "backup/step_registry.hpp"
#include "common/job.hpp"
#include <memory>
#include <string>

struct OrchestratorOptions {
    ConfirmationPolicy policy;
    bool continueOnError{false};        // non-destructive failures only
    std::string reportFile{"report.txt"};
    std::string reportTitle{"Backup report"};
    bool verify{true};
};

// Drives one job through a step registry: skips what the journal already
// holds, asks the gate about everything else, runs accepted steps and
// journals each success before moving on.
//
// Throws StepExecutionError when a step fails (unless continueOnError covers
// it) and JobCancelledError when the operator interrupts the run.
class JobOrchestrator {
public:
    JobOrchestrator(std::shared_ptr<ConfirmationGate> gate,
                    std::shared_ptr<StateJournal> journal,
                    std::shared_ptr<BackupVerifier> verifier,
                    OrchestratorOptions options = {});

    RunReport run(Job& job, const StepRegistry& registry, const ResumeState& resumeState);

    const ConfirmationPolicy& getPolicy() const { return policy_; }

private:
    void runStep(Job& job, const Step& step, const ResumeState& resumeState, RunReport& report);
    void handleFailure(Job& job, const Step& step, const std::string& cause, double seconds,
                       RunReport& report);
    void checkCancelled(Job& job, const std::string& stepId, RunReport& report);
    void writeReport(const Job& job, const RunReport& report) const;

    std::shared_ptr<ConfirmationGate> gate_;
    std::shared_ptr<StateJournal> journal_;
    std::shared_ptr<BackupVerifier> verifier_;
    OrchestratorOptions options_;
    ConfirmationPolicy policy_;
    bool sealed_{false};
};
