#pragma once

#include <memory>
#include <string>
#include <vector>

// Outcome of a single call into an external capability.
struct ToolResult {
    bool success{false};
    std::string errorMessage;

    static ToolResult ok() { return ToolResult{true, ""}; }
    static ToolResult failure(const std::string& message) { return ToolResult{false, message}; }
};

class FileSync {
public:
    virtual ~FileSync() = default;

    // Copies source into dest. A destructive sync also deletes files in dest
    // that are absent from source. Excludes are rsync patterns anchored at the
    // tree root ("/backups"); excluded paths are neither copied nor deleted.
    virtual ToolResult syncTree(const std::string& source, const std::string& dest, bool destructive,
                                const std::vector<std::string>& excludes) = 0;
};

class Archiver {
public:
    virtual ~Archiver() = default;

    virtual ToolResult archive(const std::string& srcDir, const std::string& destFile) = 0;
    virtual ToolResult extract(const std::string& archiveFile, const std::string& destDir) = 0;

    // Member paths relative to the archive root, directories included.
    virtual ToolResult listMembers(const std::string& archiveFile, std::vector<std::string>& members) = 0;
};

class Cipher {
public:
    virtual ~Cipher() = default;

    virtual ToolResult encrypt(const std::string& plainFile, const std::string& cipherFile,
                               const std::string& passphrase) = 0;
    virtual ToolResult decrypt(const std::string& cipherFile, const std::string& plainFile,
                               const std::string& passphrase) = 0;
};

class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual ToolResult create(const std::string& repo, const std::vector<std::string>& sources,
                              std::string& archiveId) = 0;
    virtual ToolResult restore(const std::string& repo, const std::string& archiveId,
                               const std::string& dest) = 0;
    virtual ToolResult latestArchive(const std::string& repo, std::string& archiveId) = 0;
    virtual ToolResult check(const std::string& repo) = 0;
};

class BlockImager {
public:
    virtual ~BlockImager() = default;

    virtual ToolResult imageDevice(const std::string& device, const std::string& destFile, bool resumable) = 0;
    virtual ToolResult writeDevice(const std::string& srcFile, const std::string& device) = 0;
    virtual bool isBlockDevice(const std::string& path) const = 0;
};

enum class PackageSource {
    RPM,
    FLATPAK,
    PIP
};

std::string toString(PackageSource source);
bool parsePackageSource(const std::string& name, PackageSource& source);

struct PackageSpec {
    PackageSource source;
    std::string name;     // rpm/flatpak: package or application id, pip: "name==version"
};

class PackageManager {
public:
    virtual ~PackageManager() = default;

    // Installed packages of one source. A source whose tool is missing
    // yields an empty list.
    virtual ToolResult queryInstalledPackages(PackageSource source, std::vector<PackageSpec>& packages) = 0;
    virtual ToolResult installPackages(const std::vector<PackageSpec>& packages) = 0;
    virtual bool isToolAvailable(const std::string& tool) const = 0;
};

class DatabaseDumper {
public:
    virtual ~DatabaseDumper() = default;

    virtual bool isAvailable() const = 0;
    virtual ToolResult dumpAll(const std::string& destDir) = 0;
};

// The set of capabilities a job can call into. Shared and stateless.
struct Collaborators {
    std::shared_ptr<FileSync> fileSync;
    std::shared_ptr<Archiver> archiver;
    std::shared_ptr<Cipher> cipher;
    std::shared_ptr<SnapshotStore> snapshotStore;
    std::shared_ptr<BlockImager> blockImager;
    std::shared_ptr<PackageManager> packageManager;
    std::shared_ptr<DatabaseDumper> databaseDumper;
};
