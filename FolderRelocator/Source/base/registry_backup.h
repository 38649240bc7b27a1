// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef REGISTRY_BACKUP_H_834275908345709834
#define REGISTRY_BACKUP_H_834275908345709834

#include <mutex>
#include "folder_registry.h"


namespace frl
{
struct RegistryBackup
{
    std::string backupId; //128-bit GUID, lower-case hex
    FolderType folderType = FolderType::documents;
    std::vector<RegistryValue> values; //verbatim, as read before the job
    time_t creationTime = 0;
    std::string jobId;
    bool restored = false;
    time_t restoreTime = 0; //restored only

    bool operator==(const RegistryBackup&) const = default;
};

//-------------------------------------------------------------------------------------------

DEFINE_NEW_FILE_ERROR(FileErrorDatabaseNotExisting)
DEFINE_NEW_FILE_ERROR(FileErrorDatabaseCorrupted)

//backup store file: chronological order (oldest first)
std::vector<RegistryBackup> loadBackupStore(const Zstring& storeFilePath); //throw FileError, FileErrorDatabaseNotExisting, FileErrorDatabaseCorrupted

//transactional + durable: returns after data and folder entry are flushed
void saveBackupStore(const std::vector<RegistryBackup>& backups, const Zstring& storeFilePath); //throw FileError

//-------------------------------------------------------------------------------------------

/*  sole owner of registry mutations:
      - a backup is durably persisted before the registry value for its folder type may change
      - restore() writes the stored values back verbatim; file content is never touched
      - backups outlive the job: removed only by explicit user request

    THREAD-SAFETY: all operations hold the folder type's FolderTypeLock; store access is serialized process-wide */
class RegistryBackupManager
{
public:
    RegistryBackupManager(FolderRegistry& registry, const Zstring& storeFilePath) : registry_(registry), storeFilePath_(storeFilePath) {}

    RegistryBackup backup(FolderType type, const std::string& jobId); //throw RegistryAccessError

    void restore(const std::string& backupId); //throw RegistryAccessError

    //requires an unrestored backup for this folder type
    void commit(FolderType type, const Zstring& newFolderPath); //throw RegistryAccessError

    std::vector<RegistryBackup> list() const; //throw FileError; newest first

    void remove(const std::string& backupId); //throw FileError

    Zstring getCurrentLocation(FolderType type) const; //throw RegistryAccessError

    const Zstring& getStorePath() const { return storeFilePath_; }

private:
    RegistryBackupManager           (const RegistryBackupManager&) = delete;
    RegistryBackupManager& operator=(const RegistryBackupManager&) = delete;

    std::vector<RegistryBackup> loadStore() const; //throw FileError, FileErrorDatabaseCorrupted; caller must hold lockStore_!

    FolderRegistry& registry_;
    const Zstring storeFilePath_;
    mutable std::mutex lockStore_; //serialize read-modify-write of the store file
};

Zstring getDefaultBackupStorePath(); //throw FileError
}

#endif //REGISTRY_BACKUP_H_834275908345709834
