// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include <algorithm>
#include <csignal>
#include <iostream>
#include <zen/format_unit.h>
#include <zen/open_ssl.h>
#include <zen/resolve_path.h>
#include <zen/sys_info.h>
#include <zen/thread.h>
#include <zen/time.h>
#include "afs/native.h"
#include "base/config.h"
#include "base/relocation.h"
#include "base/return_codes.h"
#include "base/user_dirs.h"

using namespace zen;
using namespace frl;


namespace
{
std::atomic<bool> userAbortRequested{false};

extern "C" void onInterruptSignal(int /*sig*/)
{
    userAbortRequested = true; //lock-free: async-signal-safe
}


std::mutex& getConsoleLock()
{
    static std::mutex consoleLock; //observers run on their own dispatcher threads
    return consoleLock;
}


void printLine(const std::wstring& msg)
{
    std::lock_guard dummy(getConsoleLock());
    std::cout << utfTo<std::string>(msg) + '\n' << std::flush;
}


void notifyAppError(const std::wstring& msg)
{
    std::lock_guard dummy(getConsoleLock());
    std::cerr << utfTo<std::string>(_("Error") + L": " + msg) + '\n';
}


void showSyntaxHelp()
{
    printLine(_("Syntax:") + L"\n\n" +
              L"FolderRelocator" + L'\n' +
              TAB_SPACE + L"-target " + _("folder") + L" -folders Documents,Pictures,..." + L'\n' +
              TAB_SPACE + L"[-policy none|files|folders|all] [-skip-checksum] [-keep-originals]" + L'\n' +
              TAB_SPACE + L"[-no-default-location] [-continue-on-error] [-purge-on-failure] [-dry-run]" + L'\n' +
              TAB_SPACE + L"[-margin GiB] [-append-user] [-threads " + _("count") + L"] [-log-folder " + _("folder") + L"]" + L'\n' +
              TAB_SPACE + L"[-user-dirs " + _("file") + L"] [-backup-store " + _("file") + L"]" + L"\n\n" +

              L"FolderRelocator -list-backups" + L'\n' +
              L"FolderRelocator -restore " + _("backup ID") + L'\n' +
              L"FolderRelocator -delete-backup " + _("backup ID") + L"\n\n" +

              L"-target" + L'\n' +
              _("Destination root: each folder is moved to <target>/<folder name> and replaced by a junction.") + L"\n\n" +

              L"-folders" + L'\n' +
              _("Comma-separated list of:") + L" Desktop, Documents, Downloads, Music, Pictures, Videos, Templates, Public, AppData" + L"\n\n" +

              L"-policy" + L'\n' +
              _("How to handle items already existing at the destination. Default: none (fail)") + L"\n\n" +

              L"-keep-originals" + L'\n' +
              _("Keep the original files as <folder name>_backup next to the junction.") + L"\n\n" +

              L"-no-default-location" + L'\n' +
              _("Create the junction only and leave the user folder configuration unchanged.") + L"\n\n" +

              L"-margin" + L'\n' +
              _("Free space required at the destination in addition to the data size. Default: 5 GiB") + L"\n\n" +

              L"-restore" + L'\n' +
              _("Write the user folder configuration saved in a backup back. Files are not moved."));
}

//-------------------------------------------------------------------------------------------

class ConsoleProgressObserver : public ProgressObserver
{
public:
    explicit ConsoleProgressObserver(FolderType type) : folderName_(utfTo<std::wstring>(getFolderName(type))) {}

    void onProgress(const ProgressEvent& event) override
    {
        for (size_t i = errorsShown_; i < event.errors.size(); ++i)
            printLine(L'[' + folderName_ + L"] " + formatErrorEntry(event.errors[i]));
        errorsShown_ = event.errors.size();

        if (event.phase != lastPhase_)
        {
            if (lastPhase_ == JobStatus::transferring)
                printLine(L'[' + folderName_ + L"] " + formatNumber(event.filesDone) + L'/' + formatNumber(event.filesTotal) + L' ' + _("items") + L", " +
                          formatFilesizeShort(event.bytesDone) + L'/' + formatFilesizeShort(event.bytesTotal));

            printLine(L'[' + folderName_ + L"] " + getStatusLabel(event.phase));
            lastPhase_ = event.phase;
        }
    }

private:
    const std::wstring folderName_;
    JobStatus lastPhase_ = JobStatus::idle;
    size_t errorsShown_ = 0;
};


void printReport(const TransferReport& report)
{
    std::wstring msg = L'[' + utfTo<std::wstring>(getFolderName(report.folderType)) + L"] " +
                       getTaskResultLabel(getTaskResult(report)) + (report.dryRun ? L" (" + _("Dry run") + L')' : L"") + L'\n' +
                       TAB_SPACE + _("Status:") + L' ' + getStatusLabel(report.finalStatus) + L'\n' +
                       TAB_SPACE + _("Items moved:") + L' ' + formatNumber(report.filesMoved) + L" (" + formatFilesizeShort(static_cast<int64_t>(report.bytesMoved)) + L")\n" +
                       TAB_SPACE + _("Items skipped:") + L' ' + formatNumber(report.filesSkipped) + L'\n' +
                       TAB_SPACE + _("Total time:") + L' ' + formatTimeSpan(report.elapsedMs / 1000);

    if (!report.backupId.empty())
        msg += L'\n' + std::wstring(TAB_SPACE) + _("Registry backup:") + L' ' + utfTo<std::wstring>(report.backupId);

    if (report.partialCleanup)
        msg += L'\n' + std::wstring(TAB_SPACE) + _("Original folder was not removed completely.");

    if (report.dryRun)
        for (const FileRecord& rec : report.records)
            if (!rec.note.empty())
                msg += L'\n' + std::wstring(TAB_SPACE) + utfTo<std::wstring>(rec.relPath) + L": " + getFileStatusLabel(rec.status) + L" - " + rec.note;

    for (const ErrorEntry& entry : report.errors)
        msg += L'\n' + std::wstring(TAB_SPACE) + formatErrorEntry(entry);

    if (!report.logFilePath.empty())
        msg += L'\n' + std::wstring(TAB_SPACE) + _("Log file:") + L' ' + fmtPath(report.logFilePath);

    printLine(msg);

    if (!report.logFileError.empty())
        notifyAppError(report.logFileError);
}


void printBackups(const std::vector<RegistryBackup>& backups)
{
    if (backups.empty())
        return printLine(_("No registry backups found."));

    for (const RegistryBackup& backup : backups) //newest first
    {
        std::wstring msg = utfTo<std::wstring>(backup.backupId) + L"  " +
                           utfTo<std::wstring>(getFolderName(backup.folderType)) + L"  " +
                           utfTo<std::wstring>(formatTime(Zstr("%Y-%m-%d %H:%M:%S"), getLocalTime(backup.creationTime)));
        if (backup.restored)
            msg += L"  [" + _("Restored") + L' ' + utfTo<std::wstring>(formatTime(Zstr("%Y-%m-%d %H:%M:%S"), getLocalTime(backup.restoreTime))) + L']';

        for (const RegistryValue& value : backup.values)
            msg += L'\n' + std::wstring(TAB_SPACE) + utfTo<std::wstring>(value.name) + L" = " +
                   (value.data ? utfTo<std::wstring>(*value.data) : L'<' + _("not set") + L'>');
        printLine(msg);
    }
}

//-------------------------------------------------------------------------------------------

FrlExitCode runRelocation(const RelocationConfig& cfg, const std::shared_ptr<const AbstractFileSystem>& afs, RegistryBackupManager& backupManager) //throw FileError
{
    const std::vector<RelocationJob> jobs = createRelocationJobs(cfg, backupManager); //throw FileError, InvalidPathError, RegistryAccessError

    std::vector<std::unique_ptr<RelocationOrchestrator>> orchestrators;
    for (const RelocationJob& job : jobs)
        orchestrators.push_back(std::make_unique<RelocationOrchestrator>(job, afs, backupManager, nullptr /*privilegeCheck*/,
                                                                         std::make_shared<ConsoleProgressObserver>(job.folderType)));

    //distinct folder types run concurrently
    std::vector<std::future<TransferReport>> pendingReports;
    for (const std::unique_ptr<RelocationOrchestrator>& orch : orchestrators)
        pendingReports.push_back(runAsync([orchPtr = orch.get()] { return orchPtr->run(); }));

    bool cancelForwarded = false;
    for (std::future<TransferReport>& fut : pendingReports)
        while (fut.wait_for(UI_UPDATE_INTERVAL) != std::future_status::ready)
            if (userAbortRequested && !cancelForwarded)
            {
                printLine(_("Stopping..."));
                for (const std::unique_ptr<RelocationOrchestrator>& orch : orchestrators)
                    orch->requestCancel();
                cancelForwarded = true;
            }

    FrlExitCode exitCode = FrlExitCode::success;
    for (std::future<TransferReport>& fut : pendingReports)
    {
        const TransferReport report = fut.get();
        printReport(report);
        raiseExitCode(exitCode, getExitCode(getTaskResult(report)));
    }
    return exitCode;
}


size_t parsePositiveNumber(const Zstring& arg, const char* option) //throw FileError
{
    if (arg.empty() || !std::all_of(arg.begin(), arg.end(), [](Zchar c) { return isDigit(c); }))
        throw FileError(replaceCpy(replaceCpy(_("Invalid value %x for %y."), L"%x", fmtPath(arg)), L"%y", utfTo<std::wstring>(option)));
    return stringTo<size_t>(arg);
}
}


int main(int argc, char* argv[])
{
    openSslInit();

    std::vector<Zstring> commandArgs;
    for (int i = 1; i < argc; ++i) //remove first argument which is exe path by convention
        commandArgs.push_back(argv[i]);

    FrlExitCode exitCode = FrlExitCode::success;
    try
    {
        RelocationConfig cfg;
        Zstring userDirsFilePathAlt;
        bool listBackups = false;
        std::optional<std::string> restoreBackupId;
        std::optional<std::string> deleteBackupId;
        {
            const char* optionTarget            = "-target";
            const char* optionFolders           = "-folders";
            const char* optionPolicy            = "-policy";
            const char* optionSkipChecksum      = "-skip-checksum";
            const char* optionKeepOriginals     = "-keep-originals";
            const char* optionNoDefaultLocation = "-no-default-location";
            const char* optionContinueOnError   = "-continue-on-error";
            const char* optionPurgeOnFailure    = "-purge-on-failure";
            const char* optionMargin            = "-margin";
            const char* optionDryRun            = "-dry-run";
            const char* optionAppendUser        = "-append-user";
            const char* optionThreads           = "-threads";
            const char* optionLogFolder         = "-log-folder";
            const char* optionUserDirs          = "-user-dirs";
            const char* optionBackupStore       = "-backup-store";
            const char* optionListBackups       = "-list-backups";
            const char* optionRestore           = "-restore";
            const char* optionDeleteBackup      = "-delete-backup";
            const char* optionNoBackup          = "-no-backup";

            auto isHelpRequest = [](const Zstring& arg)
            {
                auto it = std::find_if(arg.begin(), arg.end(), [](Zchar c) { return c != Zstr('/') && c != Zstr('-'); });
                if (it == arg.begin()) return false; //require at least one prefix character

                const Zstring argTmp(it, arg.end());
                return equalAsciiNoCase(argTmp, "help") ||
                       equalAsciiNoCase(argTmp, "h")    ||
                       argTmp == Zstr("?");
            };

            auto isCommandLineOption = [&](const Zstring& arg)
            {
                return startsWith(arg, Zstr('-')) || isHelpRequest(arg);
            };

            auto getOptionValue = [&](std::vector<Zstring>::const_iterator& it, const char* option) //throw FileError
            {
                if (++it == commandArgs.end() || isCommandLineOption(*it))
                    throw FileError(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(option)));
                return *it;
            };

            for (auto it = commandArgs.cbegin(); it != commandArgs.cend(); ++it)
                if (isHelpRequest(*it))
                {
                    showSyntaxHelp();
                    return static_cast<int>(FrlExitCode::success);
                }
                else if (equalAsciiNoCase(*it, optionTarget))
                    cfg.targetPath = getResolvedFilePath(getOptionValue(it, optionTarget)); //throw FileError
                else if (equalAsciiNoCase(*it, optionFolders))
                {
                    for (const Zstring& name : splitCpy(getOptionValue(it, optionFolders), Zstr(','), SplitOnEmpty::skip)) //throw FileError
                        if (const std::optional<FolderType> type = parseFolderType(trimCpy(name)))
                            cfg.folderTypes.push_back(*type);
                        else
                            throw FileError(replaceCpy(_("Unknown folder %x."), L"%x", fmtPath(trimCpy(name))));
                }
                else if (equalAsciiNoCase(*it, optionPolicy))
                {
                    const Zstring policyName = getOptionValue(it, optionPolicy); //throw FileError
                    if (const std::optional<OverwritePolicy> policy = parseOverwritePolicy(policyName))
                        cfg.overwritePolicy = *policy;
                    else
                        throw FileError(replaceCpy(replaceCpy(_("Invalid value %x for %y."), L"%x", fmtPath(policyName)), L"%y", utfTo<std::wstring>(optionPolicy)));
                }
                else if (equalAsciiNoCase(*it, optionSkipChecksum))
                    cfg.skipChecksum = true;
                else if (equalAsciiNoCase(*it, optionKeepOriginals))
                    cfg.deleteOriginals = false;
                else if (equalAsciiNoCase(*it, optionNoDefaultLocation))
                    cfg.setAsDefaultLocation = false;
                else if (equalAsciiNoCase(*it, optionContinueOnError))
                    cfg.errorHandling = ErrorHandling::continueOnError;
                else if (equalAsciiNoCase(*it, optionPurgeOnFailure))
                    cfg.purgeDestinationOnFailure = true;
                else if (equalAsciiNoCase(*it, optionMargin))
                    cfg.minFreeSpaceMargin = parseFreeSpaceMargin(getOptionValue(it, optionMargin)); //throw FileError
                else if (equalAsciiNoCase(*it, optionDryRun))
                    cfg.dryRun = true;
                else if (equalAsciiNoCase(*it, optionAppendUser))
                    cfg.appendUserName = true;
                else if (equalAsciiNoCase(*it, optionThreads))
                    cfg.parallelOps = parsePositiveNumber(getOptionValue(it, optionThreads), optionThreads); //throw FileError
                else if (equalAsciiNoCase(*it, optionLogFolder))
                    cfg.logFolderPath = getResolvedFilePath(getOptionValue(it, optionLogFolder)); //throw FileError
                else if (equalAsciiNoCase(*it, optionUserDirs))
                    userDirsFilePathAlt = getResolvedFilePath(getOptionValue(it, optionUserDirs)); //throw FileError
                else if (equalAsciiNoCase(*it, optionBackupStore))
                    cfg.backupStorePath = getResolvedFilePath(getOptionValue(it, optionBackupStore)); //throw FileError
                else if (equalAsciiNoCase(*it, optionListBackups))
                    listBackups = true;
                else if (equalAsciiNoCase(*it, optionRestore))
                    restoreBackupId = getOptionValue(it, optionRestore); //throw FileError
                else if (equalAsciiNoCase(*it, optionDeleteBackup))
                    deleteBackupId = getOptionValue(it, optionDeleteBackup); //throw FileError
                else if (equalAsciiNoCase(*it, optionNoBackup))
                    throw FileError(replaceCpy(_("Option %x is not supported."), L"%x", utfTo<std::wstring>(optionNoBackup)),
                                    _("The user folder configuration is always saved before it is changed."));
                else
                    throw FileError(replaceCpy(_("Unknown command line option %x."), L"%x", fmtPath(*it)));

            if (commandArgs.empty())
            {
                showSyntaxHelp();
                return static_cast<int>(FrlExitCode::exception);
            }
        }
        //----------------------------------------------------------------------------------------------------

        const auto nativeFs = std::make_shared<const NativeFileSystem>();

        XdgUserDirsRegistry registry(!userDirsFilePathAlt.empty() ? userDirsFilePathAlt : getDefaultUserDirsFilePath(), //throw FileError
                                     getUserHome()); //throw FileError
        RegistryBackupManager backupManager(registry, !cfg.backupStorePath.empty() ? cfg.backupStorePath : getDefaultBackupStorePath()); //throw FileError

        if (listBackups)
            printBackups(backupManager.list()); //throw FileError
        else if (restoreBackupId)
        {
            backupManager.restore(*restoreBackupId); //throw RegistryAccessError
            printLine(replaceCpy(_("Restored registry backup %x."), L"%x", utfTo<std::wstring>(*restoreBackupId)));
        }
        else if (deleteBackupId)
        {
            backupManager.remove(*deleteBackupId); //throw FileError
            printLine(replaceCpy(_("Deleted registry backup %x."), L"%x", utfTo<std::wstring>(*deleteBackupId)));
        }
        else
        {
            std::signal(SIGINT,  onInterruptSignal);
            std::signal(SIGTERM, onInterruptSignal);

            raiseExitCode(exitCode, runRelocation(cfg, nativeFs, backupManager)); //throw FileError
        }
    }
    catch (const FileError& e)
    {
        raiseExitCode(exitCode, FrlExitCode::exception);
        notifyAppError(e.toString());
    }
    return static_cast<int>(exitCode);
}
