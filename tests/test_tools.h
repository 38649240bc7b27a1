// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef TEST_TOOLS_H_5602938475610293847
#define TEST_TOOLS_H_5602938475610293847

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <sys/stat.h>
#include <gtest/gtest.h>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/file_path.h>
#include <zen/guid.h>
#include "afs/native.h"
#include "base/folder_registry.h"


namespace frl
{
//fresh folder below $TMPDIR, removed recursively on destruction (symlinks are not followed)
class TempFolder
{
public:
    TempFolder() : path_(zen::appendPath(zen::getTempFolderPath(), Zstr("frl_test_") + zen::generateGuidHex().substr(0, 12)))
    {
        zen::createDirectory(path_); //throw FileError
    }

    ~TempFolder()
    {
        try { NativeFileSystem().removeFolderIfExistsRecursion(path_); }
        catch (const zen::FileError& e) { ADD_FAILURE() << zen::utfTo<std::string>(e.toString()); }
    }

    const Zstring& path() const { return path_; }
    Zstring operator()(const Zstring& relPath) const { return zen::appendPath(path_, relPath); }

private:
    TempFolder           (const TempFolder&) = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    const Zstring path_;
};


inline
void writeTestFile(const Zstring& filePath, const std::string& content) //throw FileError
{
    if (const std::optional<Zstring> parentPath = zen::getParentFolderPath(filePath))
        zen::createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    zen::setFileContent(filePath, content, nullptr /*notifyUnbufferedIO*/); //throw FileError
}


inline
std::string readTestFile(const Zstring& filePath) //throw FileError
{
    return zen::getFileContent(filePath, nullptr /*notifyUnbufferedIO*/); //throw FileError
}


//deterministic, not compressible
inline
std::string makeTestData(size_t size, uint32_t seed)
{
    std::string data(size, '\0');
    uint32_t state = seed * 2654435761U + 1;
    for (char& c : data)
    {
        state = state * 1664525U + 1013904223U;
        c = static_cast<char>(state >> 24);
    }
    return data;
}


inline
std::set<Zstring> getRelPaths(const std::vector<AFS::FolderEntry>& entries)
{
    std::set<Zstring> relPaths;
    for (const AFS::FolderEntry& entry : entries)
        relPaths.insert(entry.relPath);
    return relPaths;
}


inline
RelocationJob makeTestJob(const Zstring& sourcePath, const Zstring& destinationRoot, const RelocationConfig& cfg, FolderType type = FolderType::documents)
{
    RelocationJob job;
    job.jobId           = zen::generateGuidHex();
    job.folderType      = type;
    job.sourcePath      = sourcePath;
    job.destinationRoot = destinationRoot;
    job.destinationPath = zen::appendPath(destinationRoot, getFolderName(type));
    job.config          = std::make_shared<const RelocationConfig>(cfg);
    return job;
}


//defaults suitable for tests: no free space margin, short delays
inline
RelocationConfig makeTestConfig(const Zstring& targetPath)
{
    RelocationConfig cfg;
    cfg.targetPath           = targetPath;
    cfg.folderTypes          = {FolderType::documents};
    cfg.minFreeSpaceMargin   = 0;
    cfg.lockedFileRetryDelay = std::chrono::milliseconds(10);
    cfg.fileOperationTimeout = std::chrono::seconds(5);
    return cfg;
}

//-------------------------------------------------------------------------------------------

class InMemoryFolderRegistry : public FolderRegistry
{
public:
    explicit InMemoryFolderRegistry(const Zstring& homePath) : homePath_(homePath) {}

    std::vector<RegistryValue> readValues(FolderType type) const override //throw RegistryAccessError
    {
        std::lock_guard dummy(lock_);
        if (failReads_)
            throw RegistryAccessError(L"Simulated registry read error.", Zstring(), EACCES);

        auto it = values_.find(type);
        return {RegistryValue{.name = getValueName(type), .data = it != values_.end() ? it->second : std::optional<Zstring>()}};
    }

    void writeValues(FolderType type, const std::vector<RegistryValue>& values) override //throw RegistryAccessError
    {
        std::lock_guard dummy(lock_);
        for (const RegistryValue& val : values)
            if (val.data)
                values_[type] = *val.data;
            else
                values_.erase(type);
    }

    Zstring getFolderPath(FolderType type) const override //throw RegistryAccessError
    {
        std::lock_guard dummy(lock_);
        auto it = values_.find(type);
        return it != values_.end() ? it->second : zen::appendPath(homePath_, getFolderName(type));
    }

    void setFolderPath(FolderType type, const Zstring& folderPath) override //throw RegistryAccessError
    {
        std::lock_guard dummy(lock_);
        if (failWrites_)
            throw RegistryAccessError(L"Simulated registry write error.", Zstring(), EACCES);
        values_[type] = folderPath;
    }

    std::optional<Zstring> getRawValue(FolderType type) const
    {
        std::lock_guard dummy(lock_);
        auto it = values_.find(type);
        return it != values_.end() ? it->second : std::optional<Zstring>();
    }

    void setFailWrites(bool fail) { std::lock_guard dummy(lock_); failWrites_ = fail; } //setFolderPath() only
    void setFailReads (bool fail) { std::lock_guard dummy(lock_); failReads_  = fail; }

private:
    static Zstring getValueName(FolderType type) { return getXdgKey(type) ? *getXdgKey(type) : Zstr("FRL_") + getFolderName(type); }

    const Zstring homePath_;
    mutable std::mutex lock_;
    std::map<FolderType, Zstring> values_;
    bool failWrites_ = false;
    bool failReads_  = false;
};


//owner, group and mode bits
inline
struct stat getItemStat(const Zstring& itemPath, zen::ProcSymlink procSl)
{
    struct stat itemInfo = {};
    const int rv = procSl == zen::ProcSymlink::follow ? ::stat(itemPath.c_str(), &itemInfo) : ::lstat(itemPath.c_str(), &itemInfo);
    EXPECT_EQ(rv, 0) << itemPath;
    return itemInfo;
}


//-------------------------------------------------------------------------------------------

//NativeFileSystem with injected faults; items are selected by file name
class FaultyFileSystem : public NativeFileSystem
{
public:
    //ErrorFileLocked for the next "count" copies of this file
    void setLocked(const Zstring& fileName, int count) { std::lock_guard dummy(lock_); lockedFiles_[fileName] = count; }

    //the next "count" copies of this file get a flipped byte
    void setCorrupt(const Zstring& fileName, int count) { std::lock_guard dummy(lock_); corruptFiles_[fileName] = count; }

    //copy of this file reports "no progress" for up to "duration"
    void setStalled(const Zstring& fileName, std::chrono::milliseconds duration) { std::lock_guard dummy(lock_); stalledFiles_[fileName] = duration; }

    //copy of this file hangs for "duration" without any progress callback, like a read blocked in the kernel
    void setBlocked(const Zstring& fileName, std::chrono::milliseconds duration) { std::lock_guard dummy(lock_); blockedFiles_[fileName] = duration; }

    void setFreeDiskSpace(int64_t bytes) { freeDiskSpace_ = bytes; }
    void setFailSymlinkCreation(bool fail) { failSymlinkCreation_ = fail; }
    void setMoveUnsupported(const Zstring& pathFrom) { std::lock_guard dummy(lock_); moveUnsupported_.insert(pathFrom); }
    void setResolveDelay(std::chrono::milliseconds delay) { resolveDelay_ = delay; }

    //called before each file copy, context of worker thread
    void setOnCopy(const std::function<void(const Zstring& sourcePath)>& onCopy) { std::lock_guard dummy(lock_); onCopy_ = onCopy; }

    //called before each move or rename
    void setOnMove(const std::function<void(const Zstring& pathFrom)>& onMove) { std::lock_guard dummy(lock_); onMove_ = onMove; }

    int getCopyCount() const { return copyCount_; }

    FileCopyResult copyNewFile(const Zstring& sourcePath, const Zstring& targetPath, //throw FileError, ErrorTargetExisting, ErrorFileLocked, X
                               const zen::IoCallback& notifyUnbufferedIO /*throw X*/) const override
    {
        ++copyCount_;
        const Zstring fileName = zen::getItemName(sourcePath);

        std::function<void(const Zstring& sourcePath)> onCopy;
        bool locked = false;
        bool corrupt = false;
        std::chrono::milliseconds stallDuration{0};
        std::chrono::milliseconds blockDuration{0};
        {
            std::lock_guard dummy(lock_);
            onCopy = onCopy_;
            if (auto it = lockedFiles_.find(fileName); it != lockedFiles_.end() && it->second > 0)
            {
                --it->second;
                locked = true;
            }
            if (auto it = corruptFiles_.find(fileName); it != corruptFiles_.end() && it->second > 0)
            {
                --it->second;
                corrupt = true;
            }
            if (auto it = stalledFiles_.find(fileName); it != stalledFiles_.end())
                stallDuration = it->second;
            if (auto it = blockedFiles_.find(fileName); it != blockedFiles_.end())
                blockDuration = it->second;
        }

        if (onCopy)
            onCopy(sourcePath);

        if (locked)
            throw zen::ErrorFileLocked(zen::replaceCpy(std::wstring(L"Cannot open file %x."), L"%x", zen::fmtPath(sourcePath)), L"Simulated lock.", EBUSY);

        if (stallDuration.count() > 0)
            for (const auto stallEnd = std::chrono::steady_clock::now() + stallDuration; std::chrono::steady_clock::now() < stallEnd;)
            {
                if (notifyUnbufferedIO) notifyUnbufferedIO(0); //throw X
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }

        if (blockDuration.count() > 0)
            std::this_thread::sleep_for(blockDuration);

        FileCopyResult result = NativeFileSystem::copyNewFile(sourcePath, targetPath, notifyUnbufferedIO); //throw FileError, ErrorTargetExisting, ErrorFileLocked, X

        if (corrupt)
        {
            std::string content = zen::getFileContent(targetPath, nullptr); //throw FileError
            if (content.empty())
                content = "x";
            else
                content[content.size() / 2] ^= 0x5a;

            zen::setFileContent(targetPath, content, nullptr); //throw FileError
            zen::setFileTime(targetPath, result.modTime, zen::ProcSymlink::follow); //throw FileError
        }
        return result;
    }

    int64_t getFreeDiskSpace(const Zstring& folderPath) const override //throw FileError
    {
        if (freeDiskSpace_)
            return *freeDiskSpace_;
        return NativeFileSystem::getFreeDiskSpace(folderPath); //throw FileError
    }

    void createSymlink(const Zstring& linkPath, const Zstring& targetPath) const override //throw FileError, ErrorTargetExisting
    {
        if (failSymlinkCreation_)
            throw zen::FileError(zen::replaceCpy(std::wstring(L"Cannot create symbolic link %x."), L"%x", zen::fmtPath(linkPath)), L"Simulated failure.", EPERM);
        NativeFileSystem::createSymlink(linkPath, targetPath); //throw FileError, ErrorTargetExisting
    }

    void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) const override //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
    {
        std::function<void(const Zstring& pathFrom)> onMove;
        {
            std::lock_guard dummy(lock_);
            onMove = onMove_;
        }
        if (onMove)
            onMove(pathFrom);
        {
            std::lock_guard dummy(lock_);
            if (moveUnsupported_.contains(pathFrom))
                throw zen::ErrorMoveUnsupported(zen::replaceCpy(std::wstring(L"Cannot move %x."), L"%x", zen::fmtPath(pathFrom)), L"Simulated mount point.", EXDEV);
        }
        NativeFileSystem::moveAndRenameItem(pathFrom, pathTo, replaceExisting); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
    }

    Zstring getResolvedPath(const Zstring& itemPath) const override //throw FileError
    {
        if (resolveDelay_.load().count() > 0)
            std::this_thread::sleep_for(resolveDelay_.load());
        return NativeFileSystem::getResolvedPath(itemPath); //throw FileError
    }

private:
    mutable std::mutex lock_;
    mutable std::map<Zstring, int> lockedFiles_;
    mutable std::map<Zstring, int> corruptFiles_;
    std::map<Zstring, std::chrono::milliseconds> stalledFiles_;
    std::map<Zstring, std::chrono::milliseconds> blockedFiles_;
    std::set<Zstring> moveUnsupported_;
    std::function<void(const Zstring& sourcePath)> onCopy_;
    std::function<void(const Zstring& pathFrom)> onMove_;

    std::optional<int64_t> freeDiskSpace_;
    std::atomic<bool> failSymlinkCreation_{false};
    std::atomic<std::chrono::milliseconds> resolveDelay_{std::chrono::milliseconds(0)};
    mutable std::atomic<int> copyCount_{0};
};
}

#endif //TEST_TOOLS_H_5602938475610293847
