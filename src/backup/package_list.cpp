#include "backup/package_list.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool PackageList::save(const std::string& path, const std::vector<PackageSpec>& packages, std::string& error) {
    json list = json::array();
    for (const auto& package : packages) {
        list.push_back({{"source", toString(package.source)}, {"name", package.name}});
    }
    json document;
    document["packages"] = list;

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        error = "Failed to open " + path + " for writing";
        return false;
    }
    file << document.dump(2) << "\n";
    if (!file) {
        error = "Failed to write " + path;
        return false;
    }
    return true;
}

bool PackageList::load(const std::string& path, std::vector<PackageSpec>& packages, std::string& error) {
    packages.clear();
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open " + path;
        return false;
    }

    try {
        json document;
        file >> document;
        for (const auto& item : document.at("packages")) {
            PackageSpec package;
            if (!parsePackageSource(item.at("source").get<std::string>(), package.source)) {
                error = "Unknown package source in " + path + ": " + item.at("source").dump();
                return false;
            }
            package.name = item.at("name").get<std::string>();
            packages.push_back(package);
        }
    } catch (const json::exception& e) {
        error = "Failed to parse " + path + ": " + e.what();
        return false;
    }
    return true;
}
