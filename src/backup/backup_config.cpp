#include "backup/backup_config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <typename T>
void readKey(const json& document, const char* key, T& value) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return;
    }
    try {
        value = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

BackupConfig fromJson(const json& document) {
    if (!document.is_object()) {
        throw ConfigurationError("Configuration must be a JSON object");
    }

    BackupConfig config;
    readKey(document, "work_dir", config.workDir);
    readKey(document, "home_dir", config.homeDir);
    readKey(document, "use_sudo", config.useSudo);
    readKey(document, "continue_on_error", config.continueOnError);
    readKey(document, "yes_to_all_covers_destructive", config.yesToAllCoversDestructive);
    readKey(document, "archive", config.archive);
    readKey(document, "encrypt", config.encrypt);
    readKey(document, "passphrase_file", config.passphraseFile);
    readKey(document, "device", config.device);
    readKey(document, "resumable_imaging", config.resumableImaging);
    readKey(document, "snapshot_repo", config.snapshotRepo);
    readKey(document, "snapshot_sources", config.snapshotSources);
    readKey(document, "restore_path", config.restorePath);
    readKey(document, "required_free_kb", config.requiredFreeKb);
    readKey(document, "required_tools", config.requiredTools);
    readKey(document, "log_file", config.logFile);
    readKey(document, "log_level", config.logLevel);

    std::string mode;
    readKey(document, "mode", mode);
    if (!mode.empty() && !parseBackupMode(mode, config.mode)) {
        throw ConfigurationError("Unknown backup mode: " + mode);
    }

    LogLevel level;
    if (!Logger::parseLogLevel(config.logLevel, level)) {
        throw ConfigurationError("Unknown log level: " + config.logLevel);
    }
    return config;
}

} // namespace

BackupConfig BackupConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    Logger::debug("Loading configuration from " + path);
    return fromJsonText(buffer.str());
}

BackupConfig BackupConfig::fromJsonText(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Failed to parse configuration: " + std::string(e.what()));
    }
    return fromJson(document);
}

void BackupConfig::applyEnvironment() {
    if (homeDir.empty()) {
        const char* home = std::getenv("HOME");
        if (home) {
            homeDir = home;
        }
    }
}
