#pragma once

#include "backup/collaborators.hpp"

// rsync -aH with a partial directory so an interrupted copy resumes.
class RsyncFileSync : public FileSync {
public:
    explicit RsyncFileSync(bool useSudo = false);

    ToolResult syncTree(const std::string& source, const std::string& dest, bool destructive,
                        const std::vector<std::string>& excludes) override;

private:
    bool useSudo_;
};
