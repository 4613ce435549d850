#include "backup/tools/dnf_package_manager.hpp"
#include "common/logger.hpp"
#include "common/process_runner.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <map>

namespace {

const char* queryCommand(PackageSource source) {
    switch (source) {
        case PackageSource::RPM:     return "rpm -qa --qf '%{NAME}\\n'";
        case PackageSource::FLATPAK: return "flatpak list --app --columns=application";
        case PackageSource::PIP:     return "pip freeze";
        default:                     return "";
    }
}

const char* toolFor(PackageSource source) {
    switch (source) {
        case PackageSource::RPM:     return "rpm";
        case PackageSource::FLATPAK: return "flatpak";
        case PackageSource::PIP:     return "pip";
        default:                     return "";
    }
}

} // namespace

DnfPackageManager::DnfPackageManager(bool useSudo)
    : useSudo_(useSudo) {
}

ToolResult DnfPackageManager::queryInstalledPackages(PackageSource source, std::vector<PackageSpec>& packages) {
    packages.clear();
    if (!isToolAvailable(toolFor(source))) {
        Logger::warning(std::string(toolFor(source)) + " not found, no " + toString(source) + " packages recorded");
        return ToolResult::ok();
    }

    CommandResult result = ProcessRunner::capture(queryCommand(source));
    if (!result.succeeded()) {
        return ToolResult::failure("Listing " + toString(source) + " packages failed: " +
                                   ProcessRunner::describe(result));
    }

    std::vector<std::string> names;
    for (const auto& line : result.output) {
        std::string name = utils::trim(line);
        if (!name.empty()) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());

    for (const auto& name : names) {
        packages.push_back({source, name});
    }
    Logger::info("Found " + std::to_string(packages.size()) + " " + toString(source) + " packages");
    return ToolResult::ok();
}

ToolResult DnfPackageManager::installPackages(const std::vector<PackageSpec>& packages) {
    std::map<PackageSource, std::vector<std::string>> bySource;
    for (const auto& package : packages) {
        bySource[package.source].push_back(package.name);
    }
    for (const auto& entry : bySource) {
        ToolResult result = install(entry.first, entry.second);
        if (!result.success) {
            return result;
        }
    }
    return ToolResult::ok();
}

ToolResult DnfPackageManager::install(PackageSource source, const std::vector<std::string>& names) {
    if (names.empty()) {
        return ToolResult::ok();
    }

    std::vector<std::string> args;
    std::string prefix;
    switch (source) {
        case PackageSource::RPM:
            args = {"dnf", "install", "-y"};
            prefix = useSudo_ ? "sudo " : "";
            break;
        case PackageSource::FLATPAK:
            args = {"flatpak", "install", "-y"};
            break;
        case PackageSource::PIP:
            args = {"pip", "install"};
            break;
    }
    args.insert(args.end(), names.begin(), names.end());

    Logger::info("Installing " + std::to_string(names.size()) + " " + toString(source) + " packages");
    CommandResult result = ProcessRunner::run(prefix + ProcessRunner::join(args));
    if (!result.succeeded()) {
        return ToolResult::failure("Installing " + toString(source) + " packages failed: " +
                                   ProcessRunner::describe(result));
    }
    return ToolResult::ok();
}

bool DnfPackageManager::isToolAvailable(const std::string& tool) const {
    return ProcessRunner::commandExists(tool);
}
