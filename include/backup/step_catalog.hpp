#pragma once

#include <string>
#include <vector>

// One live directory copied into a step folder, optionally into a
// subfolder when a step captures several directories.
struct CapturedSource {
    std::string path;
    std::string subdir;
};

struct CapturedDirectory {
    std::string id;
    std::string description;
    std::vector<CapturedSource> sources;
    bool restorable{true};
};

// Directories of a selective backup, in capture order.
std::vector<CapturedDirectory> capturedDirectories(const std::string& homeDir);

// /var/log, captured last and never written back.
CapturedDirectory systemLogDirectory();

// Anchored rsync excludes keeping the jobs of workDir out of a sync of tree:
// "/<rel>" for a work directory below tree, "/backup_*" when the work
// directory is tree itself, nothing when it lies elsewhere.
std::vector<std::string> excludesWithin(const std::string& tree, const std::string& workDir);
