// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "log_file.h"
#include <zen/file_io.h>
#include <zen/format_unit.h>
#include <zen/time.h>
#include "return_codes.h"

using namespace zen;
using namespace frl;


namespace
{
const int LOG_PREVIEW_MAX = 25;
const int SEPARATION_LINE_LEN = 40;


std::string generateLogHeaderTxt(const TransferReport& report, int logPreviewMax)
{
    const auto tabSpace = utfTo<std::string>(TAB_SPACE);

    const TimeComp tc = getLocalTime(report.startTime); //returns TimeComp() on error
    const std::string headerLine = "FolderRelocator " + utfTo<std::string>(getFolderName(report.folderType)) + ' ' +
                                   utfTo<std::string>(formatTime(formatIsoDateTag, tc) + Zstr(" [") + formatTime(formatTimeTag, tc) + Zstr(']'));

    //assemble summary box
    std::vector<std::string> summary;
    summary.emplace_back();
    summary.push_back(tabSpace + utfTo<std::string>(getTaskResultLabel(getTaskResult(report)) +
                                                    (report.dryRun ? L" (" + _("Dry run") + L')' : L"")));
    summary.emplace_back();
    summary.push_back(tabSpace + utfTo<std::string>(_("Status:") + L' ' + getStatusLabel(report.finalStatus)));
    summary.push_back(tabSpace + utfTo<std::string>(_("Job ID:")) + ' ' + report.jobId);
    summary.push_back(tabSpace + utfTo<std::string>(_("Source:")      + L' ' + utfTo<std::wstring>(report.sourcePath)));
    summary.push_back(tabSpace + utfTo<std::string>(_("Destination:") + L' ' + utfTo<std::wstring>(report.destinationPath)));
    if (!report.backupId.empty())
        summary.push_back(tabSpace + utfTo<std::string>(_("Registry backup:")) + ' ' + report.backupId);
    summary.emplace_back();

    const ErrorLogStats logCount = getStats(report.log);

    if (logCount.error   > 0) summary.push_back(tabSpace + utfTo<std::string>(_("Errors:")   + L' ' + formatNumber(logCount.error)));
    if (logCount.warning > 0) summary.push_back(tabSpace + utfTo<std::string>(_("Warnings:") + L' ' + formatNumber(logCount.warning)));

    summary.push_back(tabSpace + utfTo<std::string>(_("Items moved:") + L' ' + formatNumber(report.filesMoved) + //show always, even if 0!
                                                    L" (" + formatFilesizeShort(static_cast<int64_t>(report.bytesMoved)) + L')'));
    if (report.filesSkipped > 0)
        summary.push_back(tabSpace + utfTo<std::string>(_("Items skipped:") + L' ' + formatNumber(report.filesSkipped)));

    if (report.partialCleanup)
        summary.push_back(tabSpace + utfTo<std::string>(_("Original folder was not removed completely.")));

    summary.push_back(tabSpace + utfTo<std::string>(_("Total time:")) + ' ' + utfTo<std::string>(formatTimeSpan(report.elapsedMs / 1000)));

    size_t sepLineLen = 0; //calculate max width (considering Unicode!)
    for (const std::string& str : summary) sepLineLen = std::max(sepLineLen, unicodeLength(str));

    std::string output = headerLine + '\n';
    output += std::string(sepLineLen + 1, '_') + '\n';

    for (const std::string& str : summary)
        output += '|' + str + '\n';

    output += '|' + std::string(sepLineLen, '_') + "\n\n";

    //------------ warnings/errors preview ----------------
    const int logFailTotal = logCount.warning + logCount.error;
    if (logFailTotal > 0)
    {
        output += '\n' + utfTo<std::string>(_("Errors and warnings:")) + '\n';
        output += std::string(SEPARATION_LINE_LEN, '_') + '\n';

        int previewCount = 0;
        for (const LogEntry& entry : report.log)
            if (entry.type & (MSG_TYPE_WARNING | MSG_TYPE_ERROR))
            {
                if (previewCount++ >= logPreviewMax)
                    break;
                output += formatMessage(entry);
            }

        if (logFailTotal > previewCount)
            output += "  [...]  " + utfTo<std::string>(replaceCpy(_P("Showing %y of 1 item", "Showing %y of %x items", logFailTotal), //%x used as plural form placeholder!
                                                                  L"%y", formatNumber(previewCount))) + '\n';
        output += std::string(SEPARATION_LINE_LEN, '_') + "\n\n\n";
    }
    return output;
}
}


Zstring frl::generateLogFileName(const TransferReport& report)
{
    const TimeComp tc = getLocalTime(report.startTime);

    return Zstr("FolderRelocator ") + getFolderName(report.folderType) + Zstr(' ') +
           formatTime(Zstr("%Y-%m-%d %H%M%S"), tc) + Zstr(".log");
}


std::string frl::generateLogText(const TransferReport& report)
{
    std::string output = generateLogHeaderTxt(report, LOG_PREVIEW_MAX);

    for (const LogEntry& entry : report.log)
        output += formatMessage(entry);

    output += std::string(SEPARATION_LINE_LEN, '_') + '\n';
    return output;
}


Zstring frl::saveLogFile(const Zstring& logFolderPath, const TransferReport& report) //throw FileError
{
    const Zstring logFileName = generateLogFileName(report);
    Zstring logFilePath = appendPath(logFolderPath, logFileName);
    try
    {
        createDirectoryIfMissingRecursion(logFolderPath); //throw FileError

        //don't overwrite the log of another job started within the same second
        for (int i = 2; itemExists(logFilePath); ++i) //throw FileError
            logFilePath = appendPath(logFolderPath, beforeLast(logFileName, Zstr('.'), IfNotFoundReturn::all) +
                                     Zstr(" (") + numberTo<Zstring>(i) + Zstr(").log"));
    }
    catch (const FileError& e) //add context info regarding log file!
    {
        throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(logFilePath)), replaceCpy(e.toString(), L"\n\n", L'\n'), e.errorCode());
    }

    setFileContent(logFilePath, generateLogText(report), nullptr /*notifyUnbufferedIO*/); //throw FileError
    return logFilePath;
}
