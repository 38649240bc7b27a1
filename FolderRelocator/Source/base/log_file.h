// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef LOG_FILE_H_931726432167489732164
#define LOG_FILE_H_931726432167489732164

#include <zen/error_log.h>
#include "structures.h"


namespace frl
{
//"FolderRelocator Documents 2026-10-19 145502.log"
Zstring generateLogFileName(const TransferReport& report);

//summary box + one line per log entry
std::string generateLogText(const TransferReport& report);

//transactional: temp file + rename; creates the log folder if missing
//existing file of the same name: a unique name is generated
Zstring saveLogFile(const Zstring& logFolderPath, const TransferReport& report); //throw FileError; returns log file path
}

#endif //LOG_FILE_H_931726432167489732164
