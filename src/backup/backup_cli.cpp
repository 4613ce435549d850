#include "backup/backup_cli.hpp"
#include "backup/backup_plan.hpp"
#include "backup/backup_verifier.hpp"
#include "backup/job_orchestrator.hpp"
#include "backup/preflight.hpp"
#include "backup/state_journal.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "restore/restore_plan.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace {

const char* kVersion = "1.0.0";

std::string readFirstLine(const std::string& path) {
    std::ifstream file(path);
    std::string line;
    if (file.is_open()) {
        std::getline(file, line);
    }
    return utils::trim(line);
}

void printJournal(std::ostream& out, const std::string& title, const std::string& path) {
    ResumeState state = StateJournal(path).load();
    out << title << " (" << state.done.size() << " steps):\n";
    for (const auto& stepId : state.done) {
        out << "  " << stepId;
        auto duration = state.durations.find(stepId);
        if (duration != state.durations.end()) {
            out << "  " << std::fixed << std::setprecision(1) << duration->second << "s";
        }
        out << "\n";
    }
}

} // namespace

BackupCLI::BackupCLI(CollaboratorFactory factory, std::shared_ptr<ConfirmationGate> gate,
                     std::ostream& out, std::ostream& err)
    : factory_(std::move(factory))
    , gate_(std::move(gate))
    , out_(out)
    , err_(err) {
}

void BackupCLI::printUsage() const {
    out_ << "Usage: hostkeeper <command> [options]\n"
         << "Commands:\n"
         << "  backup    Create or resume a backup job\n"
         << "  restore   Restore a backup job (the latest one by default)\n"
         << "  verify    Check a job against its checksum manifests\n"
         << "  status    Show the journals of a job\n"
         << "\n"
         << "Options:\n"
         << "  --mode MODE              selective, disk-image or snapshot (backup)\n"
         << "  --job DIR                Job directory to resume, restore or inspect\n"
         << "  --config FILE            JSON configuration file\n"
         << "  --work-dir DIR           Directory holding the backup_* jobs\n"
         << "  --yes                    Accept non-destructive steps without asking\n"
         << "  --confirm-target TARGET  Pre-approve a device or path to overwrite\n"
         << "  --continue-on-error      Keep going after a non-destructive step fails\n"
         << "  --cleanup-on-failure     Remove the job after a fatal error\n"
         << "  --passphrase-file FILE   Archive passphrase\n"
         << "  --log-level LEVEL        debug, info, warning or error\n"
         << "  -h, --help               Show this help message\n"
         << "  -v, --version            Show version information\n";
}

CommandOptions BackupCLI::parseOptions(int argc, char* argv[]) {
    CommandOptions options;
    auto value = [&](int& i, const std::string& flag) {
        if (i + 1 >= argc) {
            throw ConfigurationError("Missing value for " + flag);
        }
        return std::string(argv[++i]);
    };

    for (int i = 0; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--mode") {
            options.mode = value(i, arg);
        } else if (arg == "--job") {
            options.jobDir = value(i, arg);
        } else if (arg == "--config") {
            options.configFile = value(i, arg);
        } else if (arg == "--work-dir") {
            options.workDir = value(i, arg);
        } else if (arg == "--passphrase-file") {
            options.passphraseFile = value(i, arg);
        } else if (arg == "--log-level") {
            options.logLevel = value(i, arg);
        } else if (arg == "--confirm-target") {
            options.confirmedTargets.insert(value(i, arg));
        } else if (arg == "-y" || arg == "--yes") {
            options.assumeYes = true;
        } else if (arg == "--continue-on-error") {
            options.continueOnError = true;
        } else if (arg == "--cleanup-on-failure") {
            options.cleanupOnFailure = true;
        } else {
            throw ConfigurationError("Unknown option: " + arg);
        }
    }
    return options;
}

int BackupCLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printUsage();
        return 0;
    }
    if (command == "-v" || command == "--version") {
        out_ << "hostkeeper version " << kVersion << "\n";
        return 0;
    }

    try {
        CommandOptions options = parseOptions(argc - 2, argv + 2);
        if (options.help) {
            printUsage();
            return 0;
        }

        if (command == "backup") {
            return handleBackupCommand(options);
        } else if (command == "restore") {
            return handleRestoreCommand(options);
        } else if (command == "verify") {
            return handleVerifyCommand(options);
        } else if (command == "status") {
            return handleStatusCommand(options);
        }
        err_ << "Error: Unknown command: " << command << "\n";
        printUsage();
        return 1;
    } catch (const ConfigurationError& e) {
        Logger::error(e.what());
        err_ << "Error: " << e.what() << "\n";
        return 1;
    }
}

BackupConfig BackupCLI::loadConfig(const CommandOptions& options) const {
    BackupConfig config = options.configFile.empty() ? BackupConfig{} : BackupConfig::fromFile(options.configFile);
    config.applyEnvironment();

    if (!options.workDir.empty()) {
        config.workDir = options.workDir;
    }
    if (!options.passphraseFile.empty()) {
        config.passphraseFile = options.passphraseFile;
    }
    if (!options.logLevel.empty()) {
        config.logLevel = options.logLevel;
    }
    if (options.continueOnError) {
        config.continueOnError = true;
    }
    if (!options.mode.empty() && !parseBackupMode(options.mode, config.mode)) {
        throw ConfigurationError("Unknown backup mode: " + options.mode);
    }

    LogLevel level;
    if (!Logger::parseLogLevel(config.logLevel, level)) {
        throw ConfigurationError("Unknown log level: " + config.logLevel);
    }
    if (!Logger::isInitialized()) {
        Logger::initialize(config.logFile, level);
    } else {
        Logger::setLogLevel(level);
    }
    return config;
}

std::shared_ptr<ConfirmationGate> BackupCLI::gateFor(const CommandOptions& options) const {
    if (!options.confirmedTargets.empty()) {
        return std::make_shared<PreapprovedTargetGate>(gate_, options.confirmedTargets);
    }
    return gate_;
}

OrchestratorOptions BackupCLI::orchestratorOptionsFor(const BackupConfig& config, const CommandOptions& options,
                                                      bool restore) {
    OrchestratorOptions orchestratorOptions;
    // --yes answers "A" up front; destructive steps still ask unless the config says otherwise
    orchestratorOptions.policy.allRemaining = options.assumeYes;
    orchestratorOptions.policy.yesToAllCoversDestructive = config.yesToAllCoversDestructive;
    orchestratorOptions.continueOnError = config.continueOnError;
    orchestratorOptions.reportFile = restore ? "restore_report.txt" : "report.txt";
    orchestratorOptions.reportTitle = restore ? "Restore report" : "Backup report";
    return orchestratorOptions;
}

int BackupCLI::reportFailure(const std::string& what, Job& job, bool cleanup) const {
    err_ << "Error: " << what << "\n";
    err_ << "Details: " << job.errorLogPath() << "\n";
    if (cleanup) {
        if (job.cleanup()) {
            err_ << "Removed job " << job.getPath() << "\n";
        }
    } else {
        err_ << "Resume with: hostkeeper <command> --job " << job.getPath() << "\n";
    }
    return 1;
}

int BackupCLI::handleBackupCommand(const CommandOptions& options) {
    BackupConfig config = loadConfig(options);
    auto gate = gateFor(options);
    Collaborators tools = factory_(config);

    std::error_code ec;
    fs::create_directories(config.workDir, ec);
    if (ec) {
        throw ConfigurationError("Failed to create work directory " + config.workDir + ": " + ec.message());
    }

    // A job that already exists is resumed with the mode it was created with
    BackupMode mode = config.mode;
    if (!options.jobDir.empty()) {
        mode = Job::open(options.jobDir).getMode();
    }
    Preflight(config, tools.packageManager, gate).run(mode, false);

    Job job = options.jobDir.empty() ? Job::create(config.workDir, mode) : Job::open(options.jobDir);
    Logger::info("Backup location: " + job.getPath());

    StepRegistry registry = buildBackupPlan(config, tools, gate, job);
    auto journal = std::make_shared<StateJournal>((fs::path(job.getPath()) / StateJournal::kBackupJournal).string());

    VerifyOptions verifyOptions;
    verifyOptions.journalFile = StateJournal::kBackupJournal;
    verifyOptions.snapshotRepo = config.snapshotRepo;
    if (!config.passphraseFile.empty()) {
        verifyOptions.passphrase = readFirstLine(config.passphraseFile);
    }
    auto verifier = std::make_shared<BackupVerifier>(tools.archiver, tools.cipher, tools.snapshotStore, verifyOptions);

    OrchestratorOptions orchestratorOptions = orchestratorOptionsFor(config, options, false);

    JobOrchestrator orchestrator(gate, journal, verifier, orchestratorOptions);
    try {
        RunReport report = orchestrator.run(job, registry, journal->load());
        out_ << report.render("Backup report for " + job.getId());
        if (report.verificationRan() && !report.verificationSucceeded()) {
            err_ << "Warning: verification failed: " << report.verificationMessage() << "\n";
        }
        out_ << "Backup finished: " << job.getPath() << "\n";
        return 0;
    } catch (const JobCancelledError& e) {
        return reportFailure(e.what(), job, false);
    } catch (const OrchestrationError& e) {
        return reportFailure(e.what(), job, options.cleanupOnFailure);
    }
}

int BackupCLI::handleRestoreCommand(const CommandOptions& options) {
    BackupConfig config = loadConfig(options);
    auto gate = gateFor(options);
    Collaborators tools = factory_(config);

    std::string jobDir = options.jobDir.empty() ? Job::findLatest(config.workDir) : options.jobDir;
    if (jobDir.empty()) {
        throw ConfigurationError("No backup found in " + config.workDir);
    }
    Job job = Job::open(jobDir);
    Logger::info("Restoring from " + job.getPath());
    Preflight(config, tools.packageManager, gate).run(job.getMode(), true);

    StepRegistry registry = buildRestorePlan(config, tools, gate, job);
    auto journal = std::make_shared<StateJournal>((fs::path(job.getPath()) / StateJournal::kRestoreJournal).string());

    VerifyOptions verifyOptions;
    verifyOptions.journalFile = StateJournal::kBackupJournal;
    verifyOptions.useArchive = false;
    verifyOptions.snapshotRepo = config.snapshotRepo;
    auto verifier = std::make_shared<BackupVerifier>(tools.archiver, tools.cipher, tools.snapshotStore, verifyOptions);

    OrchestratorOptions orchestratorOptions = orchestratorOptionsFor(config, options, true);

    JobOrchestrator orchestrator(gate, journal, verifier, orchestratorOptions);
    try {
        RunReport report = orchestrator.run(job, registry, journal->load());
        out_ << report.render("Restore report for " + job.getId());
        if (report.verificationRan() && !report.verificationSucceeded()) {
            err_ << "Warning: restore verification failed: " << report.verificationMessage() << "\n";
        }
        out_ << "Restore finished: " << job.getPath() << "\n";
        return 0;
    } catch (const OrchestrationError& e) {
        // Never remove a backup because its restore failed
        return reportFailure(e.what(), job, false);
    }
}

int BackupCLI::handleVerifyCommand(const CommandOptions& options) {
    if (options.jobDir.empty()) {
        throw ConfigurationError("verify requires --job");
    }
    BackupConfig config = loadConfig(options);
    Collaborators tools = factory_(config);
    Job job = Job::open(options.jobDir);

    VerifyOptions verifyOptions;
    verifyOptions.snapshotRepo = config.snapshotRepo;
    if (!config.passphraseFile.empty()) {
        verifyOptions.passphrase = readFirstLine(config.passphraseFile);
    }
    BackupVerifier verifier(tools.archiver, tools.cipher, tools.snapshotStore, verifyOptions);
    VerificationResult result = verifier.verify(job);
    if (!result.success) {
        err_ << "Verification of " << job.getId() << " failed: " << result.errorMessage << "\n";
        return 1;
    }
    out_ << "Verification of " << job.getId() << " passed\n";
    return 0;
}

int BackupCLI::handleStatusCommand(const CommandOptions& options) {
    if (options.jobDir.empty()) {
        throw ConfigurationError("status requires --job");
    }
    loadConfig(options);
    Job job = Job::open(options.jobDir);

    out_ << "Job:   " << job.getPath() << "\n"
         << "Mode:  " << toString(job.getMode()) << "\n"
         << "Phase: " << Job::phaseToString(job.getPhase()) << "\n";
    printJournal(out_, "Backup journal", (fs::path(job.getPath()) / StateJournal::kBackupJournal).string());
    printJournal(out_, "Restore journal", (fs::path(job.getPath()) / StateJournal::kRestoreJournal).string());

    std::error_code ec;
    for (const auto& artifact : {job.archivePath(), job.encryptedArchivePath()}) {
        if (fs::exists(artifact, ec)) {
            out_ << "Archive: " << artifact << "\n";
        }
    }
    return 0;
}
