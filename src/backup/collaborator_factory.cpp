#include "backup/collaborator_factory.hpp"
#include "backup/tools/borg_snapshot_store.hpp"
#include "backup/tools/dd_block_imager.hpp"
#include "backup/tools/dnf_package_manager.hpp"
#include "backup/tools/openssl_cipher.hpp"
#include "backup/tools/rsync_file_sync.hpp"
#include "backup/tools/sql_database_dumper.hpp"
#include "backup/tools/tar_archiver.hpp"
#include "common/logger.hpp"
#include <memory>

Collaborators createCollaborators(const BackupConfig& config) {
    Logger::debug(std::string("Creating collaborators") + (config.useSudo ? " (sudo)" : ""));

    Collaborators collaborators;
    collaborators.fileSync = std::make_shared<RsyncFileSync>(config.useSudo);
    collaborators.archiver = std::make_shared<TarArchiver>();
    collaborators.cipher = std::make_shared<OpenSSLCipher>();
    collaborators.snapshotStore = std::make_shared<BorgSnapshotStore>(config.passphraseFile);
    collaborators.blockImager = std::make_shared<DdBlockImager>(config.useSudo);
    collaborators.packageManager = std::make_shared<DnfPackageManager>(config.useSudo);
    collaborators.databaseDumper = std::make_shared<SqlDatabaseDumper>(config.useSudo);
    return collaborators;
}
