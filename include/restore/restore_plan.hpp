#pragma once

#include "backup/backup_config.hpp"
#include "backup/collaborators.hpp"
#include "backup/confirmation_gate.hpp"
#include "backup/step_registry.hpp"
#include <memory>

// Restore steps for a job directory. Every step that writes outside the job
// is destructive. Applicability is decided when a step is reached, so the
// steps after extract see the job's real mode. The job must outlive the
// returned registry.
StepRegistry buildRestorePlan(const BackupConfig& config, const Collaborators& tools,
                              std::shared_ptr<ConfirmationGate> gate, Job& job);
