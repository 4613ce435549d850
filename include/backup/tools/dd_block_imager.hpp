#pragma once

#include "backup/collaborators.hpp"

// Raw device images with dd, or ddrescue when the copy must survive an
// interruption (its map file records progress).
class DdBlockImager : public BlockImager {
public:
    explicit DdBlockImager(bool useSudo = false);

    ToolResult imageDevice(const std::string& device, const std::string& destFile, bool resumable) override;
    ToolResult writeDevice(const std::string& srcFile, const std::string& device) override;
    bool isBlockDevice(const std::string& path) const override;

private:
    bool useSudo_;
};
