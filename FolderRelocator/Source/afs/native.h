// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef FS_NATIVE_183247018532434563465
#define FS_NATIVE_183247018532434563465

#include "abstract.h"

namespace frl
{
//local file system: full paths as seen by the kernel
class NativeFileSystem : public AbstractFileSystem
{
public:
    ItemType getItemType(const Zstring& itemPath) const override; //throw FileError
    std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath) const override; //throw FileError

    void createFolderPlain(const Zstring& folderPath) const override; //throw FileError, ErrorTargetExisting
    void copyNewFolder(const Zstring& sourcePath, const Zstring& targetPath) const override; //throw FileError, ErrorTargetExisting

    void removeFilePlain   (const Zstring& filePath  ) const override; //
    void removeSymlinkPlain(const Zstring& linkPath  ) const override; //throw FileError
    void removeFolderPlain (const Zstring& folderPath) const override; //

    void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) const override; //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting

    Zstring getSymlinkContent(const Zstring& linkPath) const override; //throw FileError
    void createSymlink(const Zstring& linkPath, const Zstring& targetPath) const override; //throw FileError, ErrorTargetExisting
    void copySymlink(const Zstring& sourcePath, const Zstring& targetPath) const override; //throw FileError
    Zstring getResolvedPath(const Zstring& itemPath) const override; //throw FileError

    int64_t getFreeDiskSpace(const Zstring& folderPath) const override; //throw FileError
    void checkFolderWriteAccess(const Zstring& folderPath) const override; //throw FileError

    StreamAttributes getFileAttributes(const Zstring& filePath) const override; //throw FileError
    std::unique_ptr<InputStream> getInputStream(const Zstring& filePath) const override; //throw FileError, ErrorFileLocked

    FileCopyResult copyNewFile(const Zstring& sourcePath, const Zstring& targetPath, //throw FileError, ErrorTargetExisting, ErrorFileLocked, X
                               const zen::IoCallback& notifyUnbufferedIO /*throw X*/) const override;

    void traverseFolder(const Zstring& folderPath, //throw FileError
                        const std::function<void(const FileInfo&    fi)>& onFile,
                        const std::function<void(const FolderInfo&  fi)>& onFolder,
                        const std::function<void(const SymlinkInfo& si)>& onSymlink,
                        const std::function<void(const OtherInfo&   oi)>& onOther) const override;
};
}

#endif //FS_NATIVE_183247018532434563465
