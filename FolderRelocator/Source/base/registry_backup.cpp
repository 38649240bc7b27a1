// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "registry_backup.h"
#include <bit> //std::endian
#include <algorithm>
#include <zen/crc.h>
#include <zen/guid.h>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/sys_info.h>
#include <zen/zlib_wrap.h>
#include "folder_lock.h"

using namespace zen;
using namespace frl;


namespace
{
//-------------------------------------------------------------------------------------------------------------------------------
const char DB_FILE_DESCR[] = "FolderRelocator";
const int DB_FILE_VERSION = 1; //2026-10-19
//-------------------------------------------------------------------------------------------------------------------------------

/*------------------------------------------------------------------------------
  | ensure 32/64 bit portability: use fixed size data types only e.g. uint32_t |
  ------------------------------------------------------------------------------*/

std::string serializeBackups(const std::vector<RegistryBackup>& backups)
{
    MemoryStreamOut streamOut;
    writeNumber(streamOut, static_cast<uint32_t>(backups.size()));

    for (const RegistryBackup& b : backups)
    {
        writeContainer(streamOut, b.backupId);
        writeNumber<int32_t>(streamOut, static_cast<int32_t>(b.folderType));

        writeNumber(streamOut, static_cast<uint32_t>(b.values.size()));
        for (const RegistryValue& val : b.values)
        {
            writeContainer(streamOut, val.name);
            writeNumber<int8_t>(streamOut, val.data.has_value());
            if (val.data)
                writeContainer(streamOut, *val.data);
        }

        writeNumber<int64_t>(streamOut, b.creationTime);
        writeContainer      (streamOut, b.jobId);
        writeNumber<int8_t> (streamOut, b.restored);
        writeNumber<int64_t>(streamOut, b.restoreTime);
    }
    return std::move(streamOut.ref());
}


std::vector<RegistryBackup> deserializeBackups(const std::string& stream) //throw SysError
{
    MemoryStreamIn streamIn(stream);

    std::vector<RegistryBackup> backups;

    size_t backupCount = readNumber<uint32_t>(streamIn); //throw SysErrorUnexpectedEos
    while (backupCount-- != 0)
    {
        RegistryBackup b;
        b.backupId = readContainer<std::string>(streamIn); //throw SysErrorUnexpectedEos

        const int32_t folderType = readNumber<int32_t>(streamIn); //throw SysErrorUnexpectedEos
        if (folderType < 0 || folderType > static_cast<int32_t>(FolderType::appData))
            throw SysError(_("File content is corrupted.") + L" (invalid folder type)");
        b.folderType = static_cast<FolderType>(folderType);

        size_t valueCount = readNumber<uint32_t>(streamIn); //throw SysErrorUnexpectedEos
        while (valueCount-- != 0)
        {
            RegistryValue val;
            val.name = readContainer<Zstring>(streamIn); //throw SysErrorUnexpectedEos
            if (readNumber<int8_t>(streamIn) != 0)        //
                val.data = readContainer<Zstring>(streamIn); //
            b.values.push_back(std::move(val));
        }

        b.creationTime = readNumber<int64_t>(streamIn);          //
        b.jobId        = readContainer<std::string>(streamIn);   //throw SysErrorUnexpectedEos
        b.restored     = readNumber<int8_t>(streamIn) != 0;      //
        b.restoreTime  = readNumber<int64_t>(streamIn);          //

        backups.push_back(std::move(b));
    }
    return backups;
}


std::vector<RegistryBackup>::iterator findBackup(std::vector<RegistryBackup>& backups, const std::string& backupId)
{
    return std::find_if(backups.begin(), backups.end(), [&](const RegistryBackup& b) { return b.backupId == backupId; });
}


std::wstring getBackupNotFoundMsg(const std::string& backupId)
{
    return replaceCpy(_("Registry backup %x was not found."), L"%x", fmtPath(utfTo<std::wstring>(backupId)));
}
}


void frl::saveBackupStore(const std::vector<RegistryBackup>& backups, const Zstring& storeFilePath) //throw FileError
{
    static_assert(std::endian::native == std::endian::little);

    MemoryStreamOut memStreamOut;

    //write FolderRelocator file identifier
    writeArray(memStreamOut, DB_FILE_DESCR, sizeof(DB_FILE_DESCR));

    //save file format version
    writeNumber<int32_t>(memStreamOut, DB_FILE_VERSION);

    try
    {
        writeContainer(memStreamOut, compress(serializeBackups(backups), 3 /*level*/)); //throw SysError
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(storeFilePath)), e.toString(), e.errorCode());
    }

    writeNumber<uint32_t>(memStreamOut, getCrc32(memStreamOut.ref()));
    //------------------------------------------------------------------------------------------------------------------------

    if (const std::optional<Zstring> parentPath = getParentFolderPath(storeFilePath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    setFileContent(storeFilePath, memStreamOut.ref(), nullptr /*notifyUnbufferedIO*/); //throw FileError
}


std::vector<RegistryBackup> frl::loadBackupStore(const Zstring& storeFilePath) //throw FileError, FileErrorDatabaseNotExisting, FileErrorDatabaseCorrupted
{
    std::string byteStream;
    try
    {
        byteStream = getFileContent(storeFilePath, nullptr /*notifyUnbufferedIO*/); //throw FileError
    }
    catch (const FileError& e)
    {
        bool dbNotYetExisting = false;
        try { dbNotYetExisting = !itemExists(storeFilePath); /*throw FileError*/ }
        //abstract context => unclear which exception is more relevant/useless:
        catch (const FileError& e2) { throw FileError(replaceCpy(e.toString(), L"\n\n", L'\n'), replaceCpy(e2.toString(), L"\n\n", L'\n'), e.errorCode()); }

        if (dbNotYetExisting) //throw FileError
            throw FileErrorDatabaseNotExisting(replaceCpy(_("Database file %x does not yet exist."), L"%x", fmtPath(storeFilePath)));
        else
            throw;
    }
    //------------------------------------------------------------------------------------------------------------------------
    try
    {
        MemoryStreamIn memStreamIn(byteStream);

        char formatDescr[sizeof(DB_FILE_DESCR)] = {};
        readArray(memStreamIn, formatDescr, sizeof(formatDescr)); //throw SysErrorUnexpectedEos

        if (!std::equal(DB_FILE_DESCR, DB_FILE_DESCR + sizeof(DB_FILE_DESCR), formatDescr))
            throw SysError(_("File content is corrupted.") + L" (invalid header)");

        const int version = readNumber<int32_t>(memStreamIn); //throw SysErrorUnexpectedEos
        if (version != DB_FILE_VERSION)
            throw SysError(_("Unsupported data format.") + L' ' + replaceCpy(_("Version: %x"), L"%x", numberTo<std::wstring>(version)));

        //catch data corruption ASAP + don't rely on std::bad_alloc for consistency checking
        if (byteStream.size() < memStreamIn.pos() + sizeof(uint32_t))
            throw SysErrorUnexpectedEos();

        MemoryStreamOut crcStreamOut;
        writeNumber<uint32_t>(crcStreamOut, getCrc32(std::string_view(byteStream).substr(0, byteStream.size() - sizeof(uint32_t))));

        if (!endsWith(byteStream, crcStreamOut.ref()))
            throw SysError(_("File content is corrupted.") + L" (invalid checksum)");

        const std::string payload = readContainer<std::string>(memStreamIn); //throw SysErrorUnexpectedEos

        return deserializeBackups(decompress(payload)); //throw SysError
    }
    catch (const SysError& e)
    {
        throw FileErrorDatabaseCorrupted(replaceCpy(_("Cannot read database file %x."), L"%x", fmtPath(storeFilePath)), e.toString());
    }
}

//#######################################################################################################################################

std::vector<RegistryBackup> RegistryBackupManager::loadStore() const //throw FileError, FileErrorDatabaseCorrupted
{
    try
    {
        return loadBackupStore(storeFilePath_); //throw FileError, FileErrorDatabaseNotExisting, FileErrorDatabaseCorrupted
    }
    catch (FileErrorDatabaseNotExisting&) { return {}; } //no backups yet
}


RegistryBackup RegistryBackupManager::backup(FolderType type, const std::string& jobId) //throw RegistryAccessError
{
    FolderTypeLock dummy(type);

    RegistryBackup newBackup
    {
        .backupId     = generateGuidHex(),
        .folderType   = type,
        .values       = registry_.readValues(type), //throw RegistryAccessError
        .creationTime = std::time(nullptr),
        .jobId        = jobId,
    };

    std::lock_guard dummy2(lockStore_);
    try
    {
        std::vector<RegistryBackup> backups = loadStore(); //throw FileError, FileErrorDatabaseCorrupted
        backups.push_back(newBackup);
        saveBackupStore(backups, storeFilePath_); //throw FileError
    }
    catch (const FileError& e)
    {
        throw RegistryAccessError(replaceCpy(_("Cannot save the registry backup for %x."), L"%x", utfTo<std::wstring>(getFolderName(type))),
                                  replaceCpy(e.toString(), L"\n\n", L'\n'), storeFilePath_, e.errorCode());
    }
    return newBackup;
}


void RegistryBackupManager::restore(const std::string& backupId) //throw RegistryAccessError
{
    auto wrapStoreError = [&](const FileError& e)
    {
        return RegistryAccessError(getBackupNotFoundMsg(backupId), replaceCpy(e.toString(), L"\n\n", L'\n'), storeFilePath_, e.errorCode());
    };

    //lock order: FolderTypeLock before lockStore_ (same as backup() when called by a running job)
    const FolderType type = [&]
    {
        std::lock_guard dummy(lockStore_);
        std::vector<RegistryBackup> backups;
        try { backups = loadStore(); /*throw FileError, FileErrorDatabaseCorrupted*/ }
        catch (const FileError& e) { throw wrapStoreError(e); }

        auto it = findBackup(backups, backupId);
        if (it == backups.end())
            throw RegistryAccessError(getBackupNotFoundMsg(backupId), storeFilePath_);
        return it->folderType;
    }();

    FolderTypeLock dummy(type);
    std::lock_guard dummy2(lockStore_);

    std::vector<RegistryBackup> backups;
    try { backups = loadStore(); /*throw FileError, FileErrorDatabaseCorrupted*/ }
    catch (const FileError& e) { throw wrapStoreError(e); }

    auto it = findBackup(backups, backupId);
    if (it == backups.end()) //removed in the meantime
        throw RegistryAccessError(getBackupNotFoundMsg(backupId), storeFilePath_);

    registry_.writeValues(it->folderType, it->values); //throw RegistryAccessError

    it->restored = true;
    it->restoreTime = std::time(nullptr);
    try
    {
        saveBackupStore(backups, storeFilePath_); //throw FileError
    }
    catch (const FileError& e)
    {
        throw RegistryAccessError(replaceCpy(_("The registry was restored, but backup %x could not be marked as restored."), L"%x", fmtPath(utfTo<std::wstring>(backupId))),
                                  replaceCpy(e.toString(), L"\n\n", L'\n'), storeFilePath_, e.errorCode());
    }
}


void RegistryBackupManager::commit(FolderType type, const Zstring& newFolderPath) //throw RegistryAccessError
{
    FolderTypeLock dummy(type);
    {
        std::lock_guard dummy2(lockStore_);
        std::vector<RegistryBackup> backups;
        try { backups = loadStore(); /*throw FileError, FileErrorDatabaseCorrupted*/ }
        catch (const FileError& e)
        {
            throw RegistryAccessError(replaceCpy(_("Cannot read the registry backups for %x."), L"%x", utfTo<std::wstring>(getFolderName(type))),
                                      replaceCpy(e.toString(), L"\n\n", L'\n'), storeFilePath_, e.errorCode());
        }

        if (std::none_of(backups.begin(), backups.end(), [&](const RegistryBackup& b) { return b.folderType == type && !b.restored; }))
            throw RegistryAccessError(replaceCpy(_("Refusing to change the location of %x: no registry backup exists."),
                                                 L"%x", utfTo<std::wstring>(getFolderName(type))), storeFilePath_);
    }

    registry_.setFolderPath(type, newFolderPath); //throw RegistryAccessError
}


std::vector<RegistryBackup> RegistryBackupManager::list() const //throw FileError
{
    std::vector<RegistryBackup> backups;
    {
        std::lock_guard dummy(lockStore_);
        backups = loadStore(); //throw FileError, FileErrorDatabaseCorrupted
    }
    std::reverse(backups.begin(), backups.end()); //store is chronological
    std::stable_sort(backups.begin(), backups.end(), [](const RegistryBackup& lhs, const RegistryBackup& rhs) { return lhs.creationTime > rhs.creationTime; });
    return backups;
}


void RegistryBackupManager::remove(const std::string& backupId) //throw FileError
{
    std::lock_guard dummy(lockStore_);

    std::vector<RegistryBackup> backups = loadStore(); //throw FileError, FileErrorDatabaseCorrupted

    auto it = findBackup(backups, backupId);
    if (it == backups.end())
        throw FileError(getBackupNotFoundMsg(backupId));

    backups.erase(it);
    saveBackupStore(backups, storeFilePath_); //throw FileError
}


Zstring RegistryBackupManager::getCurrentLocation(FolderType type) const //throw RegistryAccessError
{
    FolderTypeLock dummy(type);
    return registry_.getFolderPath(type); //throw RegistryAccessError
}


Zstring frl::getDefaultBackupStorePath() //throw FileError
{
    return appendPath(appendPath(getUserDataPath(), Zstr("FolderRelocator")), Zstr("RegistryBackups.db")); //throw FileError
}
