// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "native.h"
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/file_traverser.h>
#include <zen/symlink_target.h>
    #include <sys/stat.h>

using namespace zen;
using namespace frl;


namespace
{
AFS::ItemType convertItemType(zen::ItemType type)
{
    switch (type)
    {
        case zen::ItemType::file:
            return AFS::ItemType::file;
        case zen::ItemType::folder:
            return AFS::ItemType::folder;
        case zen::ItemType::symlink:
            return AFS::ItemType::symlink;
    }
    assert(false);
    return AFS::ItemType::file;
}


struct InputStreamNative : public AFS::InputStream
{
    explicit InputStreamNative(const Zstring& filePath) : fileIn_(filePath) {} //throw FileError, ErrorFileLocked

    size_t getBlockSize() override { return fileIn_.getBlockSize(); } //throw FileError; non-zero block size is AFS contract!

    //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead, const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw FileError, ErrorFileLocked, X
    {
        const size_t bytesRead = fileIn_.tryRead(buffer, bytesToRead); //throw FileError, ErrorFileLocked
        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X
        return bytesRead;
    }

private:
    FileInputPlain fileIn_;
};
}


AFS::ItemType NativeFileSystem::getItemType(const Zstring& itemPath) const //throw FileError
{
    return convertItemType(zen::getItemType(itemPath)); //throw FileError
}


std::optional<AFS::ItemType> NativeFileSystem::getItemTypeIfExists(const Zstring& itemPath) const //throw FileError
{
    if (const std::optional<zen::ItemType> type = zen::getItemTypeIfExists(itemPath)) //throw FileError
        return convertItemType(*type);
    return std::nullopt;
}


void NativeFileSystem::createFolderPlain(const Zstring& folderPath) const //throw FileError, ErrorTargetExisting
{
    createDirectory(folderPath); //throw FileError, ErrorTargetExisting
}


void NativeFileSystem::copyNewFolder(const Zstring& sourcePath, const Zstring& targetPath) const //throw FileError, ErrorTargetExisting
{
    zen::copyNewFolder(sourcePath, targetPath); //throw FileError, ErrorTargetExisting
}


void NativeFileSystem::removeFilePlain(const Zstring& filePath) const //throw FileError
{
    zen::removeFilePlain(filePath); //throw FileError
}


void NativeFileSystem::removeSymlinkPlain(const Zstring& linkPath) const //throw FileError
{
    zen::removeSymlinkPlain(linkPath); //throw FileError
}


void NativeFileSystem::removeFolderPlain(const Zstring& folderPath) const //throw FileError
{
    removeDirectoryPlain(folderPath); //throw FileError
}


void NativeFileSystem::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) const //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
{
    zen::moveAndRenameItem(pathFrom, pathTo, replaceExisting); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
}


Zstring NativeFileSystem::getSymlinkContent(const Zstring& linkPath) const //throw FileError
{
    return getSymlinkRawContent(linkPath).targetPath; //throw FileError
}


void NativeFileSystem::createSymlink(const Zstring& linkPath, const Zstring& targetPath) const //throw FileError, ErrorTargetExisting
{
    zen::createSymlink(linkPath, targetPath); //throw FileError, ErrorTargetExisting

    ZEN_ON_SCOPE_FAIL(try { zen::removeSymlinkPlain(linkPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //root creates the junction inside the user's home
    if (const std::optional<Zstring> parentPath = getParentFolderPath(linkPath))
        copyItemOwnership(*parentPath, linkPath, ProcSymlink::asLink); //throw FileError
}


void NativeFileSystem::copySymlink(const Zstring& sourcePath, const Zstring& targetPath) const //throw FileError
{
    zen::copySymlink(sourcePath, targetPath); //throw FileError

    //ownership only: there is no lchmod()
    ZEN_ON_SCOPE_FAIL(try { zen::removeSymlinkPlain(targetPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    copyItemPermissions(sourcePath, targetPath, ProcSymlink::asLink); //throw FileError
}


Zstring NativeFileSystem::getResolvedPath(const Zstring& itemPath) const //throw FileError
{
    return zen::getResolvedPath(itemPath); //throw FileError
}


int64_t NativeFileSystem::getFreeDiskSpace(const Zstring& folderPath) const //throw FileError
{
    return zen::getFreeDiskSpace(folderPath); //throw FileError
}


void NativeFileSystem::checkFolderWriteAccess(const Zstring& folderPath) const //throw FileError
{
    zen::checkFolderWriteAccess(folderPath); //throw FileError
}


AFS::StreamAttributes NativeFileSystem::getFileAttributes(const Zstring& filePath) const //throw FileError
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), "stat");

    return {.modTime = fileInfo.st_mtime, .fileSize = static_cast<uint64_t>(fileInfo.st_size)};
}


std::unique_ptr<AFS::InputStream> NativeFileSystem::getInputStream(const Zstring& filePath) const //throw FileError, ErrorFileLocked
{
    return std::make_unique<InputStreamNative>(filePath); //throw FileError, ErrorFileLocked
}


AFS::FileCopyResult NativeFileSystem::copyNewFile(const Zstring& sourcePath, const Zstring& targetPath, //throw FileError, ErrorTargetExisting, ErrorFileLocked, X
                                                   const IoCallback& notifyUnbufferedIO /*throw X*/) const
{
    const zen::FileCopyResult nativeResult = zen::copyNewFile(sourcePath, targetPath, notifyUnbufferedIO); //throw FileError, ErrorTargetExisting, ErrorFileLocked, X

    //allow only consistent objects to be created
    ZEN_ON_SCOPE_FAIL(try { zen::removeFilePlain(targetPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //copyNewFile() adds S_IWUSR; apply exact permission bits + ownership (if root)
    copyItemPermissions(sourcePath, targetPath, ProcSymlink::follow); //throw FileError

    return
    {
        .fileSize     = nativeResult.fileSize,
        .modTime      = nativeResult.sourceModTime.tv_sec,
        .errorModTime = nativeResult.errorModTime,
    };
}


void NativeFileSystem::traverseFolder(const Zstring& folderPath, //throw FileError
                                      const std::function<void(const FileInfo&    fi)>& onFile,
                                      const std::function<void(const FolderInfo&  fi)>& onFolder,
                                      const std::function<void(const SymlinkInfo& si)>& onSymlink,
                                      const std::function<void(const OtherInfo&   oi)>& onOther) const
{
    zen::traverseFolder(folderPath, //throw FileError
    [&](const zen::FileInfo& fi)
    {
        if (onFile)
            onFile({.itemName = fi.itemName, .fileSize = fi.fileSize, .modTime = fi.modTime});
    },
    [&](const zen::FolderInfo& fi)
    {
        if (onFolder)
            onFolder({.itemName = fi.itemName});
    },
    [&](const zen::SymlinkInfo& si)
    {
        if (onSymlink)
            onSymlink({.itemName = si.itemName, .modTime = si.modTime});
    },
    [&](const zen::OtherInfo& oi)
    {
        if (onOther)
            onOther({.itemName = oi.itemName, .typeName = oi.typeName});
    });
}
