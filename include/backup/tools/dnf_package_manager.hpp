#pragma once

#include "backup/collaborators.hpp"

// rpm/dnf, flatpak and pip on a Fedora-style host.
class DnfPackageManager : public PackageManager {
public:
    explicit DnfPackageManager(bool useSudo = false);

    ToolResult queryInstalledPackages(PackageSource source, std::vector<PackageSpec>& packages) override;
    ToolResult installPackages(const std::vector<PackageSpec>& packages) override;
    bool isToolAvailable(const std::string& tool) const override;

private:
    ToolResult install(PackageSource source, const std::vector<std::string>& names);

    bool useSudo_;
};
