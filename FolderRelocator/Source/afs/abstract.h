// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef ABSTRACT_H_873450978453042524534234
#define ABSTRACT_H_873450978453042524534234

#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include <zen/file_error.h>
#include <zen/file_path.h>
#include <zen/serialize.h> //IoCallback


namespace frl
{
struct AbstractFileSystem //THREAD-SAFETY: "const" member functions must model thread-safe access!
{
    virtual ~AbstractFileSystem() {}

    enum class ItemType : unsigned char
    {
        file,
        folder,
        symlink,
    };
    //(hopefully) fast: does not distinguish between error/not existing
    virtual ItemType getItemType(const Zstring& itemPath) const = 0; //throw FileError

    //execute potentially SLOW folder traversal but distinguish error/not existing
    virtual std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath) const = 0; //throw FileError

    bool itemExists(const Zstring& itemPath) const { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError
    //----------------------------------------------------------------------------------------------------------------

    //already existing: fail
    //does NOT create parent directories recursively if not existing
    virtual void createFolderPlain(const Zstring& folderPath) const = 0; //throw FileError, ErrorTargetExisting

    //creates directories recursively if not existing
    void createFolderIfMissingRecursion(const Zstring& folderPath) const; //throw FileError

    //already existing: fail
    //symlink handling: follow
    //copies permission bits (and ownership when running as root)
    virtual void copyNewFolder(const Zstring& sourcePath, const Zstring& targetPath) const = 0; //throw FileError, ErrorTargetExisting

    virtual void removeFilePlain   (const Zstring& filePath  ) const = 0; //
    virtual void removeSymlinkPlain(const Zstring& linkPath  ) const = 0; //throw FileError; ERROR if not existing
    virtual void removeFolderPlain (const Zstring& folderPath) const = 0; //

    void removeFolderIfExistsRecursion(const Zstring& folderPath) const; //throw FileError
    //----------------------------------------------------------------------------------------------------------------

    //replaceExisting == false + already existing: ErrorTargetExisting
    //different volumes: ErrorMoveUnsupported
    virtual void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) const = 0; //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting

    //raw target text; broken symlinks are fine
    virtual Zstring getSymlinkContent(const Zstring& linkPath) const = 0; //throw FileError
    virtual void createSymlink(const Zstring& linkPath, const Zstring& targetPath) const = 0; //throw FileError, ErrorTargetExisting

    //already existing: fail
    virtual void copySymlink(const Zstring& sourcePath, const Zstring& targetPath) const = 0; //throw FileError

    //resolve all symlinks: item must exist
    virtual Zstring getResolvedPath(const Zstring& itemPath) const = 0; //throw FileError
    //----------------------------------------------------------------------------------------------------------------

    //- returns < 0 if not available
    //- folderPath does not need to exist (yet)
    virtual int64_t getFreeDiskSpace(const Zstring& folderPath) const = 0; //throw FileError

    virtual void checkFolderWriteAccess(const Zstring& folderPath) const = 0; //throw FileError
    //----------------------------------------------------------------------------------------------------------------

    struct StreamAttributes
    {
        time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
        uint64_t fileSize = 0;
    };
    //symlink handling: follow
    virtual StreamAttributes getFileAttributes(const Zstring& filePath) const = 0; //throw FileError

    struct InputStream
    {
        virtual ~InputStream() {}
        virtual size_t getBlockSize() = 0; //throw FileError; non-zero block size is AFS contract!
        virtual size_t tryRead(void* buffer, size_t bytesToRead, const zen::IoCallback& notifyUnbufferedIO /*throw X*/) = 0; //throw FileError, ErrorFileLocked, X
        //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    };
    //return value always bound:
    virtual std::unique_ptr<InputStream> getInputStream(const Zstring& filePath) const = 0; //throw FileError, ErrorFileLocked
    //----------------------------------------------------------------------------------------------------------------

    struct FileCopyResult
    {
        uint64_t fileSize = 0;
        time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
        std::optional<zen::FileError> errorModTime; //failure to set modification time
    };

    //already existing: ErrorTargetExisting
    //symlink handling: follow
    //- preserves modification time and permission bits (and ownership when running as root)
    //- failure: target is not left behind
    //- notifyUnbufferedIO: delta == 0 means "no progress" and is used to detect stalled transfers
    virtual FileCopyResult copyNewFile(const Zstring& sourcePath, const Zstring& targetPath, //throw FileError, ErrorTargetExisting, ErrorFileLocked, X
                                       const zen::IoCallback& notifyUnbufferedIO /*throw X*/) const = 0;
    //----------------------------------------------------------------------------------------------------------------

    struct FileInfo
    {
        Zstring itemName;
        uint64_t fileSize = 0; //unit: bytes!
        time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
    };

    struct FolderInfo
    {
        Zstring itemName;
    };

    struct SymlinkInfo
    {
        Zstring itemName;
        time_t modTime = 0;
    };

    struct OtherInfo //FIFO, socket, device
    {
        Zstring itemName;
        std::wstring typeName;
    };

    //- non-recursive
    //- symlinks are reported as such and not followed
    virtual void traverseFolder(const Zstring& folderPath, //throw FileError
                                const std::function<void(const FileInfo&    fi)>& onFile,    //
                                const std::function<void(const FolderInfo&  fi)>& onFolder,  //optional
                                const std::function<void(const SymlinkInfo& si)>& onSymlink, //
                                const std::function<void(const OtherInfo&   oi)>& onOther) const = 0;
    //----------------------------------------------------------------------------------------------------------------

    enum class EntryType : unsigned char
    {
        file,
        folder,
        symlink,
        other,
    };

    struct FolderEntry
    {
        EntryType type = EntryType::file;
        Zstring relPath; //relative to the traversed base folder, '/'-separated
        uint64_t fileSize = 0;
        time_t modTime = 0;
        std::wstring typeName; //EntryType::other only
    };

    //recursive; parent folders are listed before their content
    std::vector<FolderEntry> getFolderContentRecursive(const Zstring& folderPath) const; //throw FileError
};

using AFS = AbstractFileSystem;
}

#endif //ABSTRACT_H_873450978453042524534234
