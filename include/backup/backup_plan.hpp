#pragma once

#include "backup/backup_config.hpp"
#include "backup/collaborators.hpp"
#include "backup/confirmation_gate.hpp"
#include "backup/step_registry.hpp"
#include <memory>

// Ordered backup steps for the job's mode. Selective and disk-image jobs end
// with the compress and encrypt steps when the configuration asks for them.
// The job must outlive the returned registry.
StepRegistry buildBackupPlan(const BackupConfig& config, const Collaborators& tools,
                             std::shared_ptr<ConfirmationGate> gate, const Job& job);

// Reads passphraseFile, or generates a passphrase and stores it in
// <job>.passphrase readable by the owner only.
bool obtainPassphrase(const std::string& passphraseFile, const std::string& storePath,
                      std::string& passphrase, std::string& error);
