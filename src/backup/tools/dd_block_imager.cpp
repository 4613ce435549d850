#include "backup/tools/dd_block_imager.hpp"
#include "common/logger.hpp"
#include "common/process_runner.hpp"
#include <sys/stat.h>

DdBlockImager::DdBlockImager(bool useSudo)
    : useSudo_(useSudo) {
}

ToolResult DdBlockImager::imageDevice(const std::string& device, const std::string& destFile, bool resumable) {
    std::string command;
    if (resumable) {
        command = ProcessRunner::join({"ddrescue", device, destFile, destFile + ".map"});
    } else {
        command = ProcessRunner::join({"dd", "if=" + device, "of=" + destFile, "bs=4M",
                                       "conv=fsync", "status=progress"});
    }
    if (useSudo_) {
        command = "sudo " + command;
    }

    Logger::info("Imaging " + device + " to " + destFile);
    CommandResult result = ProcessRunner::run(command);
    if (!result.succeeded()) {
        return ToolResult::failure("Imaging " + device + " failed: " + ProcessRunner::describe(result));
    }
    return ToolResult::ok();
}

ToolResult DdBlockImager::writeDevice(const std::string& srcFile, const std::string& device) {
    std::string command = ProcessRunner::join({"ddrescue", "-f", srcFile, device});
    if (useSudo_) {
        command = "sudo " + command;
    }

    Logger::warning("Writing " + srcFile + " to " + device);
    CommandResult result = ProcessRunner::run(command);
    if (!result.succeeded()) {
        return ToolResult::failure("Writing " + device + " failed: " + ProcessRunner::describe(result));
    }
    return ToolResult::ok();
}

bool DdBlockImager::isBlockDevice(const std::string& path) const {
    struct stat info {};
    if (stat(path.c_str(), &info) != 0) {
        return false;
    }
    return S_ISBLK(info.st_mode);
}
