#pragma once

#include "backup/collaborators.hpp"

// Deduplicating snapshot repository driven through the borg CLI. The
// repository passphrase is read from passphraseFile when one is given.
class BorgSnapshotStore : public SnapshotStore {
public:
    explicit BorgSnapshotStore(std::string passphraseFile = "");

    ToolResult create(const std::string& repo, const std::vector<std::string>& sources,
                      std::string& archiveId) override;
    ToolResult restore(const std::string& repo, const std::string& archiveId,
                       const std::string& dest) override;
    ToolResult latestArchive(const std::string& repo, std::string& archiveId) override;
    ToolResult check(const std::string& repo) override;

private:
    std::string environment() const;
    ToolResult ensureRepository(const std::string& repo);

    std::string passphraseFile_;
};
