// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIME_H_8457092814324342453627
#define TIME_H_8457092814324342453627

#include <ctime>
#include "zstring.h"
#include "string_tools.h"


namespace zen
{
struct TimeComp //replaces std::tm
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getLocalTime(time_t utc); //convert time_t (UTC) to local time components, returns TimeComp() on error
TimeComp getLocalTime(); //utc = std::time()

/*  format (current) date and time; example:
            formatTime(formatIsoDateTag); -> "2011-10-29"
            formatTime(formatIsoTimeTag); -> "17:55:34"                       */
Zstring formatTime(const Zchar* format, const TimeComp& tc = getLocalTime()); //format as specified by "std::strftime", returns empty string on error

const Zchar* const formatIsoDateTag     = Zstr("%Y-%m-%d");          //e.g. 2001-08-23
const Zchar* const formatIsoTimeTag     = Zstr("%H:%M:%S");          //e.g. 14:55:02
const Zchar* const formatIsoDateTimeTag = Zstr("%Y-%m-%d %H:%M:%S"); //e.g. 2001-08-23 14:55:02
const Zchar* const formatTimeTag = formatIsoTimeTag;

//format time span in seconds: e.g. "0:23:05" or "23:05"
std::wstring formatTimeSpan(int64_t timeInSec, bool hourOptional = false);








//############################ implementation ##############################
inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc{};
    if (::localtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    return
    {
        .year   = ctc.tm_year + 1900,
        .month  = ctc.tm_mon + 1,
        .day    = ctc.tm_mday,
        .hour   = ctc.tm_hour,
        .minute = ctc.tm_min,
        .second = ctc.tm_sec,
    };
}


inline
TimeComp getLocalTime() { return getLocalTime(std::time(nullptr)); }


inline
Zstring formatTime(const Zchar* format, const TimeComp& tc)
{
    if (tc == TimeComp())
        return Zstring();

    std::tm ctc{};
    ctc.tm_year  = tc.year - 1900;
    ctc.tm_mon   = tc.month - 1;
    ctc.tm_mday  = tc.day;
    ctc.tm_hour  = tc.hour;
    ctc.tm_min   = tc.minute;
    ctc.tm_sec   = tc.second;
    ctc.tm_isdst = -1;

    Zchar buffer[256] = {};
    const size_t charsWritten = std::strftime(buffer, std::size(buffer), format, &ctc);
    return Zstring(buffer, charsWritten);
}


inline
std::wstring formatTimeSpan(int64_t timeInSec, bool hourOptional)
{
    const bool isNegative = timeInSec < 0;
    if (isNegative)
        timeInSec = -timeInSec;

    const int64_t hours   = timeInSec / 3600;
    const int64_t minutes = timeInSec / 60 % 60;
    const int64_t seconds = timeInSec % 60;

    std::wstring output = isNegative ? L"-" : L"";
    if (!hourOptional || hours > 0)
        output += numberTo<std::wstring>(hours) + L':' + printNumber<std::wstring>(L"%02d", static_cast<int>(minutes));
    else
        output += numberTo<std::wstring>(minutes);

    return output + L':' + printNumber<std::wstring>(L"%02d", static_cast<int>(seconds));
}
}

#endif //TIME_H_8457092814324342453627
