#include "common/process_runner.hpp"
#include "common/cancellation.hpp"
#include "common/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <csignal>
#include <sys/wait.h>

namespace {

CommandResult decodeStatus(int status) {
    CommandResult result;
    if (status == -1) {
        result.exitCode = -1;
        return result;
    }
    if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exitCode = 128 + WTERMSIG(status);
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        // sh reports a child killed by a signal as 128+N
        if (result.exitCode == 128 + SIGINT || result.exitCode == 128 + SIGTERM) {
            result.signaled = true;
        }
    }
    // system() ignores SIGINT in the parent while the child runs
    if (result.signaled) {
        Cancellation::request();
    }
    return result;
}

} // namespace

std::string ProcessRunner::quote(const std::string& argument) {
    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string ProcessRunner::join(const std::vector<std::string>& arguments) {
    std::string joined;
    for (const auto& argument : arguments) {
        if (!joined.empty()) {
            joined += " ";
        }
        joined += quote(argument);
    }
    return joined;
}

CommandResult ProcessRunner::run(const std::string& command) {
    Logger::debug("Running: " + command);
    int status = std::system(command.c_str());
    if (status == -1) {
        Logger::error("Failed to spawn shell: " + std::string(strerror(errno)));
    }
    return decodeStatus(status);
}

CommandResult ProcessRunner::capture(const std::string& command) {
    Logger::debug("Capturing: " + command);
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        Logger::error("Failed to open pipe: " + std::string(strerror(errno)));
        return CommandResult{};
    }

    std::vector<std::string> lines;
    std::string current;
    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        current += buffer;
        if (!current.empty() && current.back() == '\n') {
            current.pop_back();
            lines.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }

    CommandResult result = decodeStatus(pclose(pipe));
    result.output = std::move(lines);
    return result;
}

bool ProcessRunner::commandExists(const std::string& name) {
    return run("command -v " + quote(name) + " > /dev/null 2>&1").succeeded();
}

std::string ProcessRunner::describe(const CommandResult& result) {
    if (result.signaled) {
        return "interrupted by signal";
    }
    if (result.exitCode < 0) {
        return "could not be started";
    }
    return "exit code " + std::to_string(result.exitCode);
}
