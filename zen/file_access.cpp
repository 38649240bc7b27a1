// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
#include <algorithm>
#include <variant>
#include "file_traverser.h"
#include "scope_guard.h"
#include "symlink_target.h"
#include "file_io.h"

    #include <sys/vfs.h> //statfs
    #include <fcntl.h> //open, close, AT_SYMLINK_NOFOLLOW, UTIME_OMIT
    #include <sys/stat.h>
    #include <unistd.h> //unlink, rmdir, geteuid

using namespace zen;


namespace
{
ItemType getItemTypeImpl(const Zstring& itemPath) //throw SysError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        THROW_LAST_SYS_ERROR("lstat");

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}


std::variant<ItemType, Zstring /*last existing parent path*/> getItemTypeIfExistsImpl(const Zstring& itemPath) //throw SysError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysError
    }
    catch (const SysError& e) //let's dig deeper, but *only* if error code sounds like "not existing"
    {
        const std::optional<Zstring>& parentPath = getParentFolderPath(itemPath);
        if (!parentPath) //device root => quick access test
            throw;
        if (e.errorCode() != ENOENT)
            throw;

        const std::variant<ItemType, Zstring /*last existing parent path*/> parentTypeOrPath = getItemTypeIfExistsImpl(*parentPath); //throw SysError

        if (const ItemType* parentType = std::get_if<ItemType>(&parentTypeOrPath))
        {
            if (*parentType == ItemType::file /*obscure, but possible*/)
                throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(*parentPath))), ENOTDIR);

            const Zstring itemName = getItemName(itemPath);
            assert(!itemName.empty());

            try
            {
                auto checkName = [&](const Zstring& name) { if (name == itemName) throw SysError(_("Temporary access error:") + L' ' + e.toString(), e.errorCode()); };
                traverseFolder(*parentPath, //throw FileError
                [&](const    FileInfo& fi) { checkName(fi.itemName); },
                [&](const  FolderInfo& fi) { checkName(fi.itemName); },
                [&](const SymlinkInfo& si) { checkName(si.itemName); },
                [&](const   OtherInfo& oi) { checkName(oi.itemName); });
                //- case-sensitive comparison! itemPath must be normalized!
                //- finding the item after getItemType() previously failed is exceptional
            }
            catch (const FileError& e2) { throw SysError(replaceCpy(e2.toString(), L"\n\n", L"\n"), e2.errorCode()); }

            return *parentPath;
        }
        else
            return parentTypeOrPath;
    }
}
}


ItemType zen::getItemType(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString(), e.errorCode()); }
}


std::optional<ItemType> zen::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    try
    {
        const std::variant<ItemType, Zstring /*last existing parent path*/> typeOrPath = getItemTypeIfExistsImpl(itemPath); //throw SysError
        if (const ItemType* type = std::get_if<ItemType>(&typeOrPath))
            return *type;
        else
            return std::nullopt;
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString(), e.errorCode());
    }
}


Zstring zen::getExistingParentPath(const Zstring& itemPath) //throw FileError
{
    try
    {
        const std::variant<ItemType, Zstring /*last existing parent path*/> typeOrPath = getItemTypeIfExistsImpl(itemPath); //throw SysError
        if (std::get_if<ItemType>(&typeOrPath))
            return itemPath;
        else
            return std::get<Zstring>(typeOrPath);
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString(), e.errorCode());
    }
}


int64_t zen::getFreeDiskSpace(const Zstring& folderPath) //throw FileError
{
    const Zstring existingPath = getExistingParentPath(folderPath); //throw FileError
    try
    {
        struct statfs info = {};
        if (::statfs(existingPath.c_str(), &info) != 0) //follows symlinks!
            THROW_LAST_SYS_ERROR("statfs");
        //Linux: "Fields that are undefined for a particular file system are set to 0."
        if (static_cast<int64_t>(info.f_bsize) <= 0 ||
            static_cast<int64_t>(info.f_bavail) < 0)
            return -1;

        return static_cast<int64_t>(info.f_bsize) * static_cast<int64_t>(info.f_bavail);
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot determine free disk space for %x."), L"%x", fmtPath(folderPath)), e.toString(), e.errorCode()); }
}


Zstring zen::getTempFolderPath() //throw FileError
{
    if (const std::optional<Zstring> tempDirPath = getEnvironmentVar("TMPDIR"))
        return *tempDirPath;
    return P_tmpdir; //usually resolves to "/tmp"
}


void zen::removeFilePlain(const Zstring& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), e.toString(), e.errorCode()); }
}


void zen::removeDirectoryPlain(const Zstring& dirPath) //throw FileError
{
    try
    {
        if (::rmdir(dirPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rmdir");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dirPath)), e.toString(), e.errorCode()); }
}


void zen::removeSymlinkPlain(const Zstring& linkPath) //throw FileError
{
    try
    {
        if (::unlink(linkPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete symbolic link %x."), L"%x", fmtPath(linkPath)), e.toString(), e.errorCode()); }
}


namespace
{
std::wstring generateMoveErrorMsg(const Zstring& pathFrom, const Zstring& pathTo)
{
    if (getParentFolderPath(pathFrom) == getParentFolderPath(pathTo)) //pure "rename"
        return replaceCpy(replaceCpy(_("Cannot rename %x to %y."),
                                     L"%x", fmtPath(pathFrom)),
                          L"%y", fmtPath(getItemName(pathTo)));
    else //"move" or "move + rename"
        return trimCpy(replaceCpy(replaceCpy(_("Cannot move %x to %y."),
                                             L"%x", L'\n' + fmtPath(pathFrom)),
                                  L"%y", L'\n' + fmtPath(pathTo)));
}
}


//rename file or folder: no copying!!!
void zen::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
{
    auto getErrorMsg = [&] { return generateMoveErrorMsg(pathFrom, pathTo); };

    //rename() will never fail with EEXIST, but always (atomically) overwrite!
    //Linux: renameat2() with RENAME_NOREPLACE -> not supported by all file systems
    if (!replaceExisting)
    {
        struct stat sourceInfo = {};
        if (::lstat(pathFrom.c_str(), &sourceInfo) != 0)
        {
            const ErrorCode ec = getLastError();
            throw FileError(getErrorMsg(), formatSystemError("lstat(source)", ec), ec);
        }

        struct stat targetInfo = {};
        if (::lstat(pathTo.c_str(), &targetInfo) != 0)
        {
            const ErrorCode ec = getLastError();
            if (ec != ENOENT)
                throw FileError(getErrorMsg(), formatSystemError("lstat(target)", ec), ec);
        }
        else
        {
            if (sourceInfo.st_dev != targetInfo.st_dev ||
                sourceInfo.st_ino != targetInfo.st_ino)
                throw ErrorTargetExisting(getErrorMsg(), replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(pathTo))), EEXIST);
            //else: continue with a rename in case
        }
    }

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
    {
        const ErrorCode ec = getLastError();
        if (ec == EXDEV || //different volumes
            ec == EBUSY)   //mount point
            throw ErrorMoveUnsupported(getErrorMsg(), formatSystemError("rename", ec), ec);

        throw FileError(getErrorMsg(), formatSystemError("rename", ec), ec);
    }
}


namespace
{
void setWriteTimeNative(const Zstring& itemPath, const timespec& modTime, ProcSymlink procSl) //throw FileError
{
    /*  using open()/futimens() for regular files and utimensat(AT_SYMLINK_NOFOLLOW) for symlinks is consistent with "cp" and "touch"!
        cp:    https://github.com/coreutils/coreutils/blob/master/src/cp.c
        touch: https://github.com/coreutils/coreutils/blob/master/src/touch.c     */
    const timespec newTimes[2]
    {
        {.tv_sec = ::time(nullptr), .tv_nsec = 0}, //access time; don't use UTIME_NOW/UTIME_OMIT: more bugs!
        modTime,
    };

    if (::utimensat(AT_FDCWD, itemPath.c_str(), newTimes, procSl == ProcSymlink::asLink ? AT_SYMLINK_NOFOLLOW : 0) == 0)
        return;
    const ErrorCode ecUtimensat = getLastError();
    try
    {
        if (procSl == ProcSymlink::asLink)
        {
            if (getItemTypeImpl(itemPath) == ItemType::symlink) //throw SysError
                throw SysError(formatSystemError("utimensat(AT_SYMLINK_NOFOLLOW)", ecUtimensat), ecUtimensat);
            //else: fall back
        }

        //in other cases utimensat() returns EINVAL for CIFS/NTFS drives, but open+futimens works: https://freefilesync.org/forum/viewtopic.php?t=387
        const int fdFile = ::open(itemPath.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
        if (fdFile == -1)
            THROW_LAST_SYS_ERROR("open");
        ZEN_ON_SCOPE_EXIT(::close(fdFile));

        if (::futimens(fdFile, newTimes) != 0)
            THROW_LAST_SYS_ERROR("futimens");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write modification time of %x."), L"%x", fmtPath(itemPath)), e.toString(), e.errorCode()); }
}
}


void zen::setFileTime(const Zstring& filePath, time_t modTime, ProcSymlink procSl) //throw FileError
{
    setWriteTimeNative(filePath, {.tv_sec = modTime, .tv_nsec = 0}, procSl); //throw FileError
}


void zen::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        //don't allow creating irregular folders!
        const Zstring dirName = getItemName(dirPath);

        if (std::all_of(dirName.begin(), dirName.end(), [](Zchar c) { return c == Zstr('.'); }))
        /**/throw SysError(replaceCpy<std::wstring>(L"Invalid folder name %x.", L"%x", fmtPath(dirName)), EINVAL);

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const ErrorCode ec = getLastError(); //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("mkdir", ec), ec);
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), e.toString(), e.errorCode()); }
}


void zen::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    auto getItemType2 = [&](const Zstring& itemPath) //throw FileError
    {
        try
        { return getItemTypeImpl(itemPath); } //throw SysError
        catch (const SysError& e) //need to add context!
        {
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)),
                            replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getParentFolderPath(itemPath) ? getItemName(itemPath) : itemPath)) + L'\n' +
                            e.toString(), e.errorCode());
        }
    };

    try
    {
        //- path most likely already exists => check first
        //- do NOT use getItemTypeIfExists()! race condition when multiple threads are calling createDirectoryIfMissingRecursion()
        //- find first existing + accessible parent folder (backwards iteration):
        Zstring dirPathEx = dirPath;
        std::vector<Zstring> dirNames; //reverse order!
        for (;;)
            try
            {
                if (getItemType2(dirPathEx) == ItemType::file /*obscure, but possible*/) //throw FileError
                    throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPathEx))), ENOTDIR);
                break;
            }
            catch (FileError&) //not yet existing or access error
            {
                const std::optional<Zstring>& parentPath = getParentFolderPath(dirPathEx);
                if (!parentPath)//device root => quick access test
                    throw;
                dirNames.push_back(getItemName(dirPathEx));
                dirPathEx = *parentPath;
            }
        //-----------------------------------------------------------

        Zstring dirPathNew = dirPathEx;
        for (auto it = dirNames.rbegin(); it != dirNames.rend(); ++it)
        {
            const Zstring parentPath = dirPathNew;
            try
            {
                dirPathNew = appendPath(dirPathNew, *it);

                createDirectory(dirPathNew); //throw FileError
            }
            catch (FileError&)
            {
                try
                {
                    if (getItemType2(dirPathNew) == ItemType::file /*obscure, but possible*/) //throw FileError
                        throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPathNew))), ENOTDIR);
                    else
                        continue; //already existing => possible, if createDirectoryIfMissingRecursion() is run in parallel
                }
                catch (FileError&) {} //not yet existing or access error

                throw;
            }
            copyItemOwnership(parentPath, dirPathNew, ProcSymlink::follow); //throw FileError
        }
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), e.toString(), e.errorCode());
    }
}


void zen::copyItemOwnership(const Zstring& sourcePath, const Zstring& targetPath, ProcSymlink procSl) //throw FileError
{
    if (::geteuid() != 0) //chown() is reserved to root
        return;

    struct stat fileInfo = {};
    if (procSl == ProcSymlink::follow)
    {
        if (::stat(sourcePath.c_str(), &fileInfo) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read permissions of %x."), L"%x", fmtPath(sourcePath)), "stat");

        if (::chown(targetPath.c_str(), fileInfo.st_uid, fileInfo.st_gid) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write permissions of %x."), L"%x", fmtPath(targetPath)), "chown");
    }
    else
    {
        if (::lstat(sourcePath.c_str(), &fileInfo) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read permissions of %x."), L"%x", fmtPath(sourcePath)), "lstat");

        if (::lchown(targetPath.c_str(), fileInfo.st_uid, fileInfo.st_gid) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write permissions of %x."), L"%x", fmtPath(targetPath)), "lchown");
    }
}


void zen::copyItemPermissions(const Zstring& sourcePath, const Zstring& targetPath, ProcSymlink procSl) //throw FileError
{
    struct stat fileInfo = {};
    if (procSl == ProcSymlink::follow)
    {
        if (::stat(sourcePath.c_str(), &fileInfo) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read permissions of %x."), L"%x", fmtPath(sourcePath)), "stat");

        if (::geteuid() == 0) //elevated: don't leave root-owned items in the user's profile
            if (::chown(targetPath.c_str(), fileInfo.st_uid, fileInfo.st_gid) != 0)
                THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write permissions of %x."), L"%x", fmtPath(targetPath)), "chown");

        if (::chmod(targetPath.c_str(), fileInfo.st_mode & 07777) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write permissions of %x."), L"%x", fmtPath(targetPath)), "chmod");
    }
    else
    {
        if (::lstat(sourcePath.c_str(), &fileInfo) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read permissions of %x."), L"%x", fmtPath(sourcePath)), "lstat");

        if (::geteuid() == 0)
            if (::lchown(targetPath.c_str(), fileInfo.st_uid, fileInfo.st_gid) != 0)
                THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write permissions of %x."), L"%x", fmtPath(targetPath)), "lchown");

        try
        {
            if (getItemTypeImpl(targetPath) != ItemType::symlink && //throw SysError
                //setting access permissions doesn't make sense for symlinks on Linux: there is no lchmod()
                ::chmod(targetPath.c_str(), fileInfo.st_mode & 07777) != 0)
                THROW_LAST_SYS_ERROR("chmod");
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write permissions of %x."), L"%x", fmtPath(targetPath)), e.toString(), e.errorCode()); }
    }
}


void zen::copyNewFolder(const Zstring& sourcePath, const Zstring& targetPath) //throw FileError, ErrorTargetExisting
{
    createDirectory(targetPath); //throw FileError, ErrorTargetExisting

    //allow only consistent objects to be created
    ZEN_ON_SCOPE_FAIL(try { removeDirectoryPlain(targetPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    copyItemPermissions(sourcePath, targetPath, ProcSymlink::follow); //throw FileError
}


void zen::checkFolderWriteAccess(const Zstring& dirPath) //throw FileError
{
    const Zstring probePath = getPathWithTempName(appendPath(dirPath, Zstr(".write_test")));

    FileOutputPlain probeFile(probePath); //throw FileError, ErrorTargetExisting
    probeFile.close(); //throw FileError

    removeFilePlain(probePath); //throw FileError
}


void zen::flushFolderEntries(const Zstring& dirPath) //throw FileError
{
    try
    {
        const int fdDir = ::open(dirPath.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (fdDir == -1)
            THROW_LAST_SYS_ERROR("open");
        ZEN_ON_SCOPE_EXIT(::close(fdDir));

        if (::fsync(fdDir) != 0)
            THROW_LAST_SYS_ERROR("fsync");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file attributes of %x."), L"%x", fmtPath(dirPath)), e.toString(), e.errorCode()); }
}


void zen::copySymlink(const Zstring& sourcePath, const Zstring& targetPath) //throw FileError
{
    try
    {
        const SymlinkRawContent linkContent = getSymlinkRawContent_impl(sourcePath); //throw SysError; accept broken symlinks

        if (::symlink(linkContent.targetPath.c_str(), targetPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("symlink");
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(replaceCpy(_("Cannot copy symbolic link %x to %y."), L"%x", L'\n' + fmtPath(sourcePath)), L"%y", L'\n' + fmtPath(targetPath)), e.toString(), e.errorCode());
    }

    //allow only consistent objects to be created -> don't place before ::symlink(); targetPath may already exist!
    ZEN_ON_SCOPE_FAIL(try { removeSymlinkPlain(targetPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    struct stat sourceInfo = {};
    if (::lstat(sourcePath.c_str(), &sourceInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(sourcePath)), "lstat");

    setWriteTimeNative(targetPath, sourceInfo.st_mtim, ProcSymlink::asLink); //throw FileError
}


void zen::createSymlink(const Zstring& linkPath, const Zstring& targetPath) //throw FileError, ErrorTargetExisting
{
    if (::symlink(targetPath.c_str(), linkPath.c_str()) != 0)
    {
        const ErrorCode ec = getLastError();
        const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot create symbolic link %x to %y."), L"%x", L'\n' + fmtPath(linkPath)), L"%y", L'\n' + fmtPath(targetPath));

        if (ec == EEXIST)
            throw ErrorTargetExisting(errorMsg, formatSystemError("symlink", ec), ec);

        throw FileError(errorMsg, formatSystemError("symlink", ec), ec);
    }
}


FileCopyResult zen::copyNewFile(const Zstring& sourceFile, const Zstring& targetFile, //throw FileError, ErrorTargetExisting, ErrorFileLocked, X
                                const IoCallback& notifyUnbufferedIO /*throw X*/)
{
    FileInputPlain fileIn(sourceFile); //throw FileError, ErrorFileLocked

    const struct stat& sourceInfo = fileIn.getStatBuffered(); //throw FileError

    //analog to "cp" which copies "mode" (considering umask) by default:
    const mode_t mode = (sourceInfo.st_mode & (S_IRWXU | S_IRWXG | S_IRWXO)) | S_IWUSR;

    const int fdTarget = ::open(targetFile.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, mode);
    if (fdTarget == -1)
    {
        const ErrorCode ec = getLastError(); //copy before making other system calls!
        const std::wstring errorMsg = replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(targetFile));
        const std::wstring errorDescr = formatSystemError("open", ec);

        if (ec == EEXIST)
            throw ErrorTargetExisting(errorMsg, errorDescr, ec);

        throw FileError(errorMsg, errorDescr, ec);
    }
    FileOutputPlain fileOut(fdTarget, targetFile); //pass ownership

    unbufferedStreamCopy([&](void* buffer, size_t bytesToRead)
    {
        const size_t bytesRead = fileIn.tryRead(buffer, bytesToRead); //throw FileError, ErrorFileLocked
        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X
        return bytesRead;
    },
    fileIn.getBlockSize() /*throw FileError*/,

    [&](const void* buffer, size_t bytesToWrite)
    {
        return fileOut.tryWrite(buffer, bytesToWrite); //throw FileError
    },
    fileOut.getBlockSize() /*throw FileError*/); //throw FileError, X

    const auto targetFileIdx = fileOut.getStatBuffered().st_ino; //throw FileError

    fileOut.flushBuffers(); //throw FileError
    //close output file handle before setting file time; also good place to catch errors when closing stream!
    fileOut.close(); //throw FileError
    //==========================================================================================================
    std::optional<FileError> errorModTime;
    try
    {
        //we cannot set the target file times (::futimes) while the file descriptor is still open after a write operation:
        //this triggers bugs on Samba shares where the modification time is set to current time instead.
        setWriteTimeNative(targetFile, sourceInfo.st_mtim, ProcSymlink::follow); //throw FileError
    }
    catch (const FileError& e) { errorModTime = e; }

    return
    {
        .fileSize      = static_cast<uint64_t>(sourceInfo.st_size),
        .sourceModTime = sourceInfo.st_mtim,
        .sourceFileIdx = sourceInfo.st_ino,
        .targetFileIdx = targetFileIdx,
        .errorModTime  = errorModTime,
    };
}
