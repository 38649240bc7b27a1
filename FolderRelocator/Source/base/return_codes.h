// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef RETURN_CODES_H_81307482137054156
#define RETURN_CODES_H_81307482137054156

#include <zen/i18n.h>
#include "structures.h"


namespace frl
{
enum class FrlExitCode //as returned on process exit
{
    success = 0,
    warning,
    error,
    cancelled,
    exception,
};


inline
void raiseExitCode(FrlExitCode& rc, FrlExitCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class TaskResult
{
    success,
    warning,
    error,
    cancelled,
};


inline
TaskResult getTaskResult(const TransferReport& report)
{
    switch (report.finalStatus)
    {
        case JobStatus::completed:
            return report.partialCleanup || report.filesSkipped > 0 || !report.errors.empty() || //errors: dry run only
                   zen::getStats(report.log).warning > 0 ? TaskResult::warning : TaskResult::success;

        case JobStatus::failed:
        case JobStatus::rolledBack:
            for (const ErrorEntry& entry : report.errors)
                if (entry.kind == ErrorKind::cancelled)
                    return TaskResult::cancelled;
            return TaskResult::error;

        default: //non-terminal
            break;
    }
    assert(false);
    return TaskResult::error;
}


inline
FrlExitCode getExitCode(TaskResult result)
{
    switch (result)
    {
        //*INDENT-OFF*
        case TaskResult::success:   return FrlExitCode::success;
        case TaskResult::warning:   return FrlExitCode::warning;
        case TaskResult::error:     return FrlExitCode::error;
        case TaskResult::cancelled: return FrlExitCode::cancelled;
        //*INDENT-ON*
    }
    assert(false);
    return FrlExitCode::exception;
}


inline
std::wstring getTaskResultLabel(TaskResult result)
{
    switch (result)
    {
        //*INDENT-OFF*
        case TaskResult::success: return _("Completed successfully");
        case TaskResult::warning: return _("Completed with warnings");
        case TaskResult::error:   return _("Completed with errors");
        case TaskResult::cancelled: return _("Stopped");
        //*INDENT-ON*
    }
    assert(false);
    return std::wstring();
}
}

#endif //RETURN_CODES_H_81307482137054156
