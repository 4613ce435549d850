#pragma once

#include "backup/collaborators.hpp"
#include "common/job.hpp"
#include <functional>
#include <string>
#include <vector>

enum class StepKind {
    CAPTURE,    // writes into <job>/<id>/ and gets a checksum manifest
    FINALIZE,   // compress / encrypt the whole job
    RESTORE     // writes outside the job directory
};

struct StepContext {
    Job& job;
    std::string outputDir;  // <job>/<id> for capture steps, empty otherwise
    std::string target;     // resolved device or path, empty unless the step resolves one
};

// A read-only definition of one unit of work. Completion is tracked by the
// journal, never by the step itself.
struct Step {
    std::string id;
    std::string description;             // completes "Do you want to ..."
    std::vector<std::string> sources;
    std::string destination;
    bool destructive{false};
    bool checksummed{true};
    StepKind kind{StepKind::CAPTURE};

    // Empty means always applicable.
    std::function<bool()> applicable;
    std::function<ToolResult(const StepContext&)> action;

    // Set for steps that act on a device or path chosen at run time. For a
    // destructive step the operator must confirm the resolved target by name.
    std::function<ToolResult(std::string&)> resolveTarget;

    bool isApplicable() const { return !applicable || applicable(); }
    bool hasTarget() const { return static_cast<bool>(resolveTarget); }
};
