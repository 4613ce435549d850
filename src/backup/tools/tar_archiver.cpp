#include "backup/tools/tar_archiver.hpp"
#include "common/job.hpp"
#include "common/logger.hpp"
#include "common/process_runner.hpp"
#include <filesystem>

ToolResult TarArchiver::archive(const std::string& srcDir, const std::string& destFile) {
    // The lock file stays out so extraction never replaces a held lock
    std::string command = ProcessRunner::join({"tar", "-czf", destFile,
                                               std::string("--exclude=./") + Job::kLockFile,
                                               "-C", srcDir, "."});
    Logger::info("Compressing " + srcDir + " into " + destFile);
    CommandResult result = ProcessRunner::run(command);
    if (!result.succeeded()) {
        std::error_code ec;
        std::filesystem::remove(destFile, ec);
        return ToolResult::failure("tar failed: " + ProcessRunner::describe(result));
    }
    return ToolResult::ok();
}

ToolResult TarArchiver::extract(const std::string& archiveFile, const std::string& destDir) {
    std::error_code ec;
    std::filesystem::create_directories(destDir, ec);
    if (ec) {
        return ToolResult::failure("Failed to create " + destDir + ": " + ec.message());
    }
    Logger::info("Extracting " + archiveFile + " into " + destDir);
    CommandResult result = ProcessRunner::run(ProcessRunner::join({"tar", "-xzf", archiveFile, "-C", destDir}));
    if (!result.succeeded()) {
        return ToolResult::failure("tar extract failed: " + ProcessRunner::describe(result));
    }
    return ToolResult::ok();
}

ToolResult TarArchiver::listMembers(const std::string& archiveFile, std::vector<std::string>& members) {
    CommandResult result = ProcessRunner::capture(ProcessRunner::join({"tar", "-tzf", archiveFile}));
    if (!result.succeeded()) {
        return ToolResult::failure("tar list failed: " + ProcessRunner::describe(result));
    }
    members = std::move(result.output);
    return ToolResult::ok();
}
