#pragma once

#include "backup/backup_config.hpp"
#include "backup/collaborators.hpp"
#include "backup/confirmation_gate.hpp"
#include "backup/job_orchestrator.hpp"
#include "common/job.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <string>

struct CommandOptions {
    std::string mode;
    std::string jobDir;
    std::string configFile;
    std::string workDir;
    std::string passphraseFile;
    std::string logLevel;
    bool assumeYes{false};
    std::set<std::string> confirmedTargets;
    bool continueOnError{false};
    bool cleanupOnFailure{false};
    bool help{false};
};

class BackupCLI {
public:
    using CollaboratorFactory = std::function<Collaborators(const BackupConfig&)>;

    BackupCLI(CollaboratorFactory factory, std::shared_ptr<ConfirmationGate> gate,
              std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Returns the process exit code.
    int run(int argc, char* argv[]);
    void printUsage() const;

    // Throws ConfigurationError on an unknown flag or a missing value.
    static CommandOptions parseOptions(int argc, char* argv[]);

    static OrchestratorOptions orchestratorOptionsFor(const BackupConfig& config, const CommandOptions& options,
                                                      bool restore);

private:
    int handleBackupCommand(const CommandOptions& options);
    int handleRestoreCommand(const CommandOptions& options);
    int handleVerifyCommand(const CommandOptions& options);
    int handleStatusCommand(const CommandOptions& options);

    BackupConfig loadConfig(const CommandOptions& options) const;
    std::shared_ptr<ConfirmationGate> gateFor(const CommandOptions& options) const;
    int reportFailure(const std::string& what, Job& job, bool cleanup) const;

    CollaboratorFactory factory_;
    std::shared_ptr<ConfirmationGate> gate_;
    std::ostream& out_;
    std::ostream& err_;
};
