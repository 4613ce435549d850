#pragma once

#include "backup/backup_config.hpp"
#include "backup/collaborators.hpp"

// The production tool set: rsync, tar, OpenSSL, borg, dd/ddrescue,
// dnf/flatpak/pip and the SQL dump tools.
Collaborators createCollaborators(const BackupConfig& config);
