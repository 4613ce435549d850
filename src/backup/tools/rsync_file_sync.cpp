#include "backup/tools/rsync_file_sync.hpp"
#include "common/logger.hpp"
#include "common/process_runner.hpp"
#include <filesystem>

RsyncFileSync::RsyncFileSync(bool useSudo)
    : useSudo_(useSudo) {
}

ToolResult RsyncFileSync::syncTree(const std::string& source, const std::string& dest, bool destructive,
                                  const std::vector<std::string>& excludes) {
    std::error_code ec;
    std::filesystem::create_directories(dest, ec);
    if (ec) {
        return ToolResult::failure("Failed to create " + dest + ": " + ec.message());
    }

    // Trailing slashes copy the contents, not the directory itself
    std::string from = source.back() == '/' ? source : source + "/";
    std::string to = dest.back() == '/' ? dest : dest + "/";

    std::vector<std::string> args{"rsync", "-aH", "--partial", "--partial-dir=.rsync-partial"};
    if (destructive) {
        args.push_back("--delete");
    }
    for (const auto& pattern : excludes) {
        args.push_back("--exclude=" + pattern);
    }
    args.push_back(from);
    args.push_back(to);

    std::string command = (useSudo_ ? "sudo " : "") + ProcessRunner::join(args);
    Logger::info("Syncing " + from + " to " + to + (destructive ? " (with delete)" : ""));
    CommandResult result = ProcessRunner::run(command);
    if (!result.succeeded()) {
        return ToolResult::failure("rsync " + from + " failed: " + ProcessRunner::describe(result));
    }
    return ToolResult::ok();
}
