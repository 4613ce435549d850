#include "backup/collaborators.hpp"

std::string toString(PackageSource source) {
    switch (source) {
        case PackageSource::RPM:     return "rpm";
        case PackageSource::FLATPAK: return "flatpak";
        case PackageSource::PIP:     return "pip";
        default:                     return "unknown";
    }
}

bool parsePackageSource(const std::string& name, PackageSource& source) {
    if (name == "rpm") {
        source = PackageSource::RPM;
    } else if (name == "flatpak") {
        source = PackageSource::FLATPAK;
    } else if (name == "pip") {
        source = PackageSource::PIP;
    } else {
        return false;
    }
    return true;
}
