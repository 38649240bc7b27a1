// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ACCESS_H_8017341345614857
#define FILE_ACCESS_H_8017341345614857

#include "file_path.h"
#include "file_error.h"
#include "serialize.h" //IoCallback
    #include <sys/stat.h>

namespace zen
{
//FAT/FAT32: "Why does the timestamp of a file *increase* by up to 2 seconds when I copy it to a USB thumb drive?"
const int FAT_FILE_TIME_PRECISION_SEC = 2; //https://devblogs.microsoft.com/oldnewthing/?p=83

using FileIndex = ino_t;

enum class ItemType
{
    file, //including FIFO, socket, device
    folder,
    symlink,
};
//(hopefully) fast: does not distinguish between error/not existing
ItemType getItemType(const Zstring& itemPath); //throw FileError
//execute potentially SLOW folder traversal but distinguish error/not existing
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

//nearest parent folder that exists (or "itemPath" itself)
Zstring getExistingParentPath(const Zstring& itemPath); //throw FileError

enum class ProcSymlink
{
    asLink,
    follow
};
void setFileTime(const Zstring& filePath, time_t modTime, ProcSymlink procSl); //throw FileError

//- symlink handling: follow
//- returns < 0 if not available
//- folderPath does not need to exist (yet)
int64_t getFreeDiskSpace(const Zstring& folderPath); //throw FileError

//get per-user directory designated for temporary files:
Zstring getTempFolderPath(); //throw FileError

void removeFilePlain     (const Zstring& filePath); //throw FileError; ERROR if not existing
void removeSymlinkPlain  (const Zstring& linkPath); //throw FileError; ERROR if not existing
void removeDirectoryPlain(const Zstring& dirPath ); //throw FileError; ERROR if not existing

void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting

void createDirectory(const Zstring& dirPath); //throw FileError, ErrorTargetExisting

//creates directories recursively if not existing; new directories take over the owner of their parent
void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError

//mode bits (not for symlinks: there is no lchmod()); ownership only when running as root
void copyItemPermissions(const Zstring& sourcePath, const Zstring& targetPath, ProcSymlink procSl); //throw FileError
//owner and group only; no-op unless running as root
void copyItemOwnership  (const Zstring& sourcePath, const Zstring& targetPath, ProcSymlink procSl); //throw FileError

//already existing: fail
//symlink handling: follow
void copyNewFolder(const Zstring& sourcePath, const Zstring& targetPath); //throw FileError, ErrorTargetExisting

//write test: create + delete a probe file
void checkFolderWriteAccess(const Zstring& dirPath); //throw FileError

//flush folder entries (e.g. after rename) to disk
void flushFolderEntries(const Zstring& dirPath); //throw FileError

//no symlink resolution for the link itself; broken symlinks are fine
void copySymlink(const Zstring& sourcePath, const Zstring& targetPath); //throw FileError
void createSymlink(const Zstring& linkPath, const Zstring& targetPath); //throw FileError, ErrorTargetExisting

struct FileCopyResult
{
    uint64_t fileSize = 0;
    timespec sourceModTime = {};
    FileIndex sourceFileIdx = 0;
    FileIndex targetFileIdx = 0;
    std::optional<FileError> errorModTime; //failure to set modification time
};

//- preserves modification time and permission bits
//- ErrorFileLocked: source is opened exclusively by some other process
FileCopyResult copyNewFile(const Zstring& sourceFile, const Zstring& targetFile, //throw FileError, ErrorTargetExisting, ErrorFileLocked, X
                           const IoCallback& notifyUnbufferedIO /*throw X*/);
}

#endif //FILE_ACCESS_H_8017341345614857
