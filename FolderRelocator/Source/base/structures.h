// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef STRUCTURES_H_8210478915019450901745
#define STRUCTURES_H_8210478915019450901745

#include <chrono>
#include <memory>
#include <optional>
#include <vector>
#include <zen/error_log.h>
#include <zen/sys_error.h>
#include <zen/zstring.h>


namespace frl
{
enum class FolderType
{
    desktop,
    documents,
    downloads,
    music,
    pictures,
    videos,
    templates,
    publicShare,
    appData,
};

const std::vector<FolderType>& getAllFolderTypes();

//folder name below the home directory and below the relocation target, e.g. "Documents", "Public"
Zstring getFolderName(FolderType type);

//XDG user-dirs key, e.g. "XDG_DOCUMENTS_DIR"; AppData has none
std::optional<Zstring> getXdgKey(FolderType type);

//accepts folder names and enum names, ASCII case-insensitive: "documents", "PublicShare"
std::optional<FolderType> parseFolderType(const std::string& name);


enum class OverwritePolicy
{
    none,
    files,
    folders,
    all,
};

std::wstring getPolicyName(OverwritePolicy policy);
std::optional<OverwritePolicy> parseOverwritePolicy(const std::string& name);


enum class ErrorHandling
{
    failFast,
    continueOnError,
};


enum class JobStatus
{
    idle,
    validating,
    backingUpRegistry,
    transferring,
    verifying,
    committing,
    cleaningUp,
    completed,
    failed,
    rolledBack,
};

std::wstring getStatusLabel(JobStatus status);

inline bool isTerminalStatus(JobStatus status) { return status == JobStatus::completed || status == JobStatus::failed || status == JobStatus::rolledBack; }


enum class ErrorKind
{
    permission,
    insufficientSpace,
    pathNotFound,
    fileInUse,
    checksumMismatch,
    registryAccess,
    junctionCreation,
    partialFailure,
    invalidPath,
    cancelled,
};

std::wstring getErrorKindName(ErrorKind kind); //e.g. "PermissionError"


struct ErrorEntry
{
    ErrorKind kind = ErrorKind::partialFailure;
    JobStatus stage = JobStatus::idle; //state in which the error occurred
    Zstring path;
    zen::ErrorCode errorCode = 0; //errno, 0 if n/a
    std::wstring message;
};

std::wstring formatErrorEntry(const ErrorEntry& entry); //single line for console and log

//-------------------------------------------------------------------------------------------

enum class ItemKind : unsigned char
{
    file,
    symlink, //recreated as symlink, verified by target text
    special, //FIFO, socket, device: never copied
};

enum class FileStatus : unsigned char
{
    pending,
    copied,
    verified,
    failed,
    skipped,
};

std::wstring getFileStatusLabel(FileStatus status);

struct FileRecord
{
    Zstring relPath; //relative to the source folder
    ItemKind kind = ItemKind::file;
    uint64_t fileSize = 0;
    time_t modTime = 0;
    std::optional<std::string> checksum; //SHA-256 of the source, lower-case hex
    FileStatus status = FileStatus::pending;
    bool replacedExisting = false;
    bool createdByJob = false; //destination item did not exist before this job
    std::wstring note; //why skipped/failed
};

//-------------------------------------------------------------------------------------------

const int64_t DEFAULT_MIN_FREE_SPACE_MARGIN = 5LL * 1024 * 1024 * 1024; //5 GiB
const size_t PARALLEL_OPS_MAX = 64;

//immutable after validateConfig(): shared by all jobs of one run
struct RelocationConfig
{
    Zstring targetPath;
    std::vector<FolderType> folderTypes;
    OverwritePolicy overwritePolicy = OverwritePolicy::none;
    bool skipChecksum = false; //size + modification time only
    bool deleteOriginals = true; //false: keep as "<name>_backup" next to the junction
    bool setAsDefaultLocation = true; //false: junction only, registry unchanged
    ErrorHandling errorHandling = ErrorHandling::failFast;
    int64_t minFreeSpaceMargin = DEFAULT_MIN_FREE_SPACE_MARGIN; //[bytes]
    bool dryRun = false;
    bool appendUserName = false; //"<target>/<login user>/<Folder>"
    size_t parallelOps = 4;
    std::chrono::milliseconds lockedFileRetryDelay{500};
    std::chrono::milliseconds fileOperationTimeout{30'000};
    bool purgeDestinationOnFailure = false;
    Zstring logFolderPath; //empty: no log file
    Zstring backupStorePath; //empty: default location
};


struct RelocationJob
{
    std::string jobId; //128-bit GUID, lower-case hex
    FolderType folderType = FolderType::documents;
    Zstring sourcePath;      //current location of the folder
    Zstring destinationRoot; //RelocationConfig::targetPath (+ user name)
    Zstring destinationPath; //destinationRoot + folder name
    std::shared_ptr<const RelocationConfig> config; //bound!
    JobStatus status = JobStatus::idle;

    OverwritePolicy overwritePolicy() const { return config->overwritePolicy; }
    bool checksumEnabled() const { return !config->skipChecksum; }
    bool deleteOriginals() const { return config->deleteOriginals; }
};


struct TransferReport
{
    std::string jobId;
    FolderType folderType = FolderType::documents;
    JobStatus finalStatus = JobStatus::idle;
    int filesMoved = 0; //count of Verified
    uint64_t bytesMoved = 0;
    int64_t elapsedMs = 0;
    std::vector<ErrorEntry> errors;

    std::vector<FileRecord> records;
    int filesSkipped = 0;
    bool partialCleanup = false;
    std::string backupId; //empty if no backup was taken
    Zstring sourcePath;
    Zstring destinationPath;
    bool dryRun = false;
    time_t startTime = 0;
    zen::ErrorLog log;

    Zstring logFilePath;      //empty if no log file was configured
    std::wstring logFileError; //failure to write the log file: does not change the job outcome
};
}

#endif //STRUCTURES_H_8210478915019450901745
