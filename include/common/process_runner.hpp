#pragma once

#include <string>
#include <vector>

struct CommandResult {
    int exitCode{-1};
    bool signaled{false};  // child was terminated by a signal (e.g. Ctrl-C)
    std::vector<std::string> output;

    bool succeeded() const { return !signaled && exitCode == 0; }
};

// Spawns external tools through /bin/sh. Every argument that comes from a
// path or user input must go through quote().
class ProcessRunner {
public:
    static std::string quote(const std::string& argument);
    static std::string join(const std::vector<std::string>& arguments);

    // Runs the command with inherited stdio.
    static CommandResult run(const std::string& command);

    // Runs the command and collects its stdout, one entry per line.
    static CommandResult capture(const std::string& command);

    static bool commandExists(const std::string& name);

    static std::string describe(const CommandResult& result);
};
