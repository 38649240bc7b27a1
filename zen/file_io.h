// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include "file_access.h"
#include "serialize.h"
#include "crc.h"
#include "guid.h"


namespace zen
{
    const char LINE_BREAK[] = "\n";

/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const Zstring& getFilePath() const { return filePath_; }

    size_t getBlockSize(); //throw FileError

    static constexpr size_t defaultBlockSize = 256 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

    const struct stat& getStatBuffered(); //throw FileError

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

    void setStatBuffered(const struct stat& fileInfo) { statBuf_ = fileInfo; }

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const Zstring filePath_;
    size_t blockSizeBuf_ = 0;
    std::optional<struct stat> statBuf_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    //ErrorFileLocked: open() reports the file busy, or another process holds an exclusive flock()
    FileInputPlain(                   const Zstring& filePath); //throw FileError, ErrorFileLocked
    FileInputPlain(FileHandle handle, const Zstring& filePath); //takes ownership!

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError

private:
    FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const Zstring& filePath);
};


class FileOutputPlain : public FileBase
{
public:
    FileOutputPlain(                   const Zstring& filePath); //throw FileError, ErrorTargetExisting
    FileOutputPlain(FileHandle handle, const Zstring& filePath); //takes ownership!
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    //fsync(): data is on disk when this returns
    void flushBuffers(); //throw FileError

    //close() when done, or else file is considered incomplete and will be deleted!
};

//-----------------------------------------------------------------------------------------------

//stream I/O convenience functions:

inline
Zstring getPathWithTempName(const Zstring& filePath) //generate (hopefully) unique file name
{
    const Zstring shortGuid_ = printNumber<Zstring>(Zstr("%04x"), static_cast<unsigned int>(getCrc16(generateGUID())));
    return filePath + Zstr('.') + shortGuid_ + Zstr(".tmp");
}

[[nodiscard]] std::string getFileContent(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X

//overwrites if existing + transactional! :)
//durable: temp file is flushed before the rename, the parent folder entry after it
//replaced file: owner and mode bits are kept; new file: owner of the parent folder (root only)
void setFileContent(const Zstring& filePath, const std::string_view bytes, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X
}

#endif //FILE_IO_H_89578342758342572345
