#include "backup/step_catalog.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace {

const char* kJobPrefix = "backup_";

} // namespace

std::vector<CapturedDirectory> capturedDirectories(const std::string& homeDir) {
    return {
        {"etc", "back up system configuration (/etc)", {{"/etc", ""}}, true},
        {"var", "back up /var", {{"/var", ""}}, true},
        {"opt", "back up /opt", {{"/opt", ""}}, true},
        {"config", "back up user configuration (" + homeDir + "/.config)", {{homeDir + "/.config", ""}}, true},
        {"home", "back up the home directory (" + homeDir + ")", {{homeDir, ""}}, true},
        {"mozilla", "back up Firefox profiles", {{homeDir + "/.mozilla", ""}}, true},
        {"chrome", "back up Google Chrome profiles", {{homeDir + "/.config/google-chrome", ""}}, true},
        {"edge", "back up Microsoft Edge profiles", {{homeDir + "/.config/microsoft-edge", ""}}, true},
        {"gnome_extensions", "back up GNOME Shell extensions",
         {{homeDir + "/.local/share/gnome-shell/extensions", "user"},
          {"/usr/share/gnome-shell/extensions", "system"}}, true},
    };
}

CapturedDirectory systemLogDirectory() {
    return {"logs", "back up system logs (/var/log)", {{"/var/log", ""}}, false};
}

std::vector<std::string> excludesWithin(const std::string& tree, const std::string& workDir) {
    std::error_code ec;
    fs::path root = fs::weakly_canonical(tree, ec);
    if (ec) {
        return {};
    }
    fs::path work = fs::weakly_canonical(workDir, ec);
    if (ec) {
        return {};
    }

    fs::path relative = work.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        return {};
    }
    if (relative == ".") {
        // Jobs sit directly in the tree: skip them and their archives
        return {"/" + std::string(kJobPrefix) + "*"};
    }
    return {"/" + relative.generic_string()};
}
