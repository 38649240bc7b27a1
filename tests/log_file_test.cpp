// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include <ctime>
#include "base/log_file.h"
#include "base/return_codes.h"
#include "test_tools.h"

using namespace zen;
using namespace frl;


namespace
{
time_t getTestStartTime() //2026-10-19 14:55:02 local time
{
    std::tm ctc{};
    ctc.tm_year  = 2026 - 1900;
    ctc.tm_mon   = 10 - 1;
    ctc.tm_mday  = 19;
    ctc.tm_hour  = 14;
    ctc.tm_min   = 55;
    ctc.tm_sec   = 2;
    ctc.tm_isdst = -1; //let mktime() figure it out
    return std::mktime(&ctc);
}


TransferReport makeReport()
{
    TransferReport report;
    report.jobId           = "0123456789abcdef0123456789abcdef";
    report.folderType      = FolderType::pictures;
    report.finalStatus     = JobStatus::completed;
    report.filesMoved      = 2;
    report.bytesMoved      = 2048;
    report.sourcePath      = Zstr("/home/zenju/Pictures");
    report.destinationPath = Zstr("/mnt/storage/Pictures");
    report.backupId        = "fedcba9876543210fedcba9876543210";
    report.startTime       = getTestStartTime();
    return report;
}
}


TEST(LogFile, FileName)
{
    const TransferReport report = makeReport();
    EXPECT_EQ(generateLogFileName(report), "FolderRelocator Pictures 2026-10-19 145502.log");
}


TEST(LogFile, Text)
{
    TransferReport report = makeReport();
    logMsg(report.log, L"Relocating pictures", MSG_TYPE_INFO);
    logMsg(report.log, L"Cannot set modification time", MSG_TYPE_WARNING);

    const std::string text = generateLogText(report);

    EXPECT_NE(text.find("FolderRelocator Pictures"), std::string::npos);
    EXPECT_NE(text.find("Completed with warnings"), std::string::npos);
    EXPECT_NE(text.find(report.jobId), std::string::npos);
    EXPECT_NE(text.find(report.backupId), std::string::npos);
    EXPECT_NE(text.find("/mnt/storage/Pictures"), std::string::npos);
    EXPECT_NE(text.find("Relocating pictures"), std::string::npos);
    EXPECT_NE(text.find("Cannot set modification time"), std::string::npos);
}


TEST(LogFile, SaveCreatesUniqueNames)
{
    TempFolder tmp;
    const TransferReport report = makeReport();

    const Zstring logPath1 = saveLogFile(tmp("logs/nested"), report);
    const Zstring logPath2 = saveLogFile(tmp("logs/nested"), report);

    EXPECT_EQ(logPath1, tmp("logs/nested/" + generateLogFileName(report)));
    EXPECT_NE(logPath1, logPath2);
    EXPECT_TRUE(endsWith(logPath2, " (2).log"));

    EXPECT_EQ(readTestFile(logPath1), generateLogText(report));
    EXPECT_EQ(readTestFile(logPath2), generateLogText(report));
}


TEST(LogFile, SaveFailure)
{
    TempFolder tmp;
    writeTestFile(tmp("blocker"), "not a folder");

    EXPECT_THROW(saveLogFile(tmp("blocker/logs"), makeReport()), FileError);
}


TEST(ReturnCodes, TaskResult)
{
    TransferReport report = makeReport();
    EXPECT_EQ(getTaskResult(report), TaskResult::success);

    report.filesSkipped = 1;
    EXPECT_EQ(getTaskResult(report), TaskResult::warning);

    report.filesSkipped = 0;
    report.partialCleanup = true;
    EXPECT_EQ(getTaskResult(report), TaskResult::warning);

    report.finalStatus = JobStatus::failed;
    report.errors.push_back({.kind = ErrorKind::fileInUse});
    EXPECT_EQ(getTaskResult(report), TaskResult::error);

    report.finalStatus = JobStatus::rolledBack;
    EXPECT_EQ(getTaskResult(report), TaskResult::error);

    report.errors.push_back({.kind = ErrorKind::cancelled});
    EXPECT_EQ(getTaskResult(report), TaskResult::cancelled);

    EXPECT_EQ(getTaskResultLabel(TaskResult::cancelled), L"Stopped");
}


TEST(ReturnCodes, ExitCode)
{
    FrlExitCode rc = FrlExitCode::success;
    raiseExitCode(rc, getExitCode(TaskResult::warning));
    EXPECT_EQ(rc, FrlExitCode::warning);

    raiseExitCode(rc, getExitCode(TaskResult::error));
    raiseExitCode(rc, getExitCode(TaskResult::success));
    EXPECT_EQ(rc, FrlExitCode::error);

    EXPECT_EQ(static_cast<int>(getExitCode(TaskResult::success)), 0);
}
