#pragma once

#include "backup/collaborators.hpp"
#include <string>
#include <vector>

// packages.json: {"packages": [{"source": "rpm", "name": "bash"}, ...]}
class PackageList {
public:
    static bool save(const std::string& path, const std::vector<PackageSpec>& packages, std::string& error);
    static bool load(const std::string& path, std::vector<PackageSpec>& packages, std::string& error);
};
