// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_601673246392441846218957402563
#define EXTRA_LOG_H_601673246392441846218957402563

#include "error_log.h"
#include "thread.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors
    the owner of a larger context (e.g. a relocation job) collects them via fetchExtraLog()   */

namespace zen
{
namespace impl
{
inline Protected<ErrorLog>& refGlobalExtraLog()
{
    static Protected<ErrorLog> extraLog; //thread-safe init
    return extraLog;
}
}


inline
void logExtraError(const std::wstring& msg) //noexcept
{
    try
    {
        impl::refGlobalExtraLog().access([&](ErrorLog& log) { logMsg(log, msg, MSG_TYPE_ERROR); });
    }
    catch (const std::bad_alloc&) { assert(false); }
}


inline
ErrorLog fetchExtraLog()
{
    return impl::refGlobalExtraLog().access([](ErrorLog& log) { return std::exchange(log, ErrorLog()); });
}
}

#endif //EXTRA_LOG_H_601673246392441846218957402563
