#include "backup/tools/borg_snapshot_store.hpp"
#include "common/logger.hpp"
#include "common/process_runner.hpp"
#include "common/utils.hpp"
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

BorgSnapshotStore::BorgSnapshotStore(std::string passphraseFile)
    : passphraseFile_(std::move(passphraseFile)) {
}

std::string BorgSnapshotStore::environment() const {
    if (passphraseFile_.empty()) {
        return "BORG_PASSPHRASE='' ";
    }
    return "BORG_PASSCOMMAND=" + ProcessRunner::quote("cat " + ProcessRunner::quote(passphraseFile_)) + " ";
}

ToolResult BorgSnapshotStore::ensureRepository(const std::string& repo) {
    std::error_code ec;
    if (fs::exists(fs::path(repo) / "config", ec)) {
        return ToolResult::ok();
    }
    fs::create_directories(repo, ec);
    if (ec) {
        return ToolResult::failure("Failed to create " + repo + ": " + ec.message());
    }

    std::string encryption = passphraseFile_.empty() ? "none" : "repokey";
    Logger::info("Initializing snapshot repository " + repo);
    CommandResult result = ProcessRunner::run(
        environment() + ProcessRunner::join({"borg", "init", "--encryption=" + encryption, repo}));
    if (!result.succeeded()) {
        return ToolResult::failure("borg init failed: " + ProcessRunner::describe(result));
    }
    return ToolResult::ok();
}

ToolResult BorgSnapshotStore::create(const std::string& repo, const std::vector<std::string>& sources,
                                     std::string& archiveId) {
    if (sources.empty()) {
        return ToolResult::failure("No snapshot sources configured");
    }
    ToolResult ready = ensureRepository(repo);
    if (!ready.success) {
        return ready;
    }

    archiveId = "hostkeeper-" + utils::formatTime(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S");
    std::vector<std::string> args{"borg", "create", "--stats", repo + "::" + archiveId};
    args.insert(args.end(), sources.begin(), sources.end());

    CommandResult result = ProcessRunner::run(environment() + ProcessRunner::join(args));
    if (!result.succeeded()) {
        return ToolResult::failure("borg create failed: " + ProcessRunner::describe(result));
    }
    Logger::info("Created snapshot " + archiveId + " in " + repo);
    return ToolResult::ok();
}

ToolResult BorgSnapshotStore::restore(const std::string& repo, const std::string& archiveId,
                                      const std::string& dest) {
    std::error_code ec;
    fs::create_directories(dest, ec);
    if (ec) {
        return ToolResult::failure("Failed to create " + dest + ": " + ec.message());
    }
    // borg extract writes into the working directory
    std::string command = "cd " + ProcessRunner::quote(dest) + " && " + environment() +
                          ProcessRunner::join({"borg", "extract", repo + "::" + archiveId});
    CommandResult result = ProcessRunner::run(command);
    if (!result.succeeded()) {
        return ToolResult::failure("borg extract failed: " + ProcessRunner::describe(result));
    }
    Logger::info("Restored snapshot " + archiveId + " to " + dest);
    return ToolResult::ok();
}

ToolResult BorgSnapshotStore::latestArchive(const std::string& repo, std::string& archiveId) {
    CommandResult result = ProcessRunner::capture(
        environment() + ProcessRunner::join({"borg", "list", "--short", repo}));
    if (!result.succeeded()) {
        return ToolResult::failure("borg list failed: " + ProcessRunner::describe(result));
    }
    for (auto it = result.output.rbegin(); it != result.output.rend(); ++it) {
        std::string name = utils::trim(*it);
        if (!name.empty()) {
            archiveId = name;
            return ToolResult::ok();
        }
    }
    return ToolResult::failure("No archives in " + repo);
}

ToolResult BorgSnapshotStore::check(const std::string& repo) {
    CommandResult result = ProcessRunner::run(environment() + ProcessRunner::join({"borg", "check", repo}));
    if (!result.succeeded()) {
        return ToolResult::failure("borg check failed: " + ProcessRunner::describe(result));
    }
    return ToolResult::ok();
}
