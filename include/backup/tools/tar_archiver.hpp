#pragma once

#include "backup/collaborators.hpp"

// gzip-compressed tarballs of a whole job directory.
class TarArchiver : public Archiver {
public:
    ToolResult archive(const std::string& srcDir, const std::string& destFile) override;
    ToolResult extract(const std::string& archiveFile, const std::string& destDir) override;
    ToolResult listMembers(const std::string& archiveFile, std::vector<std::string>& members) override;
};
