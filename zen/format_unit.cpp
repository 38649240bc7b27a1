// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "format_unit.h"
#include <algorithm>
#include <cmath>
#include "i18n.h"

using namespace zen;


std::wstring zen::formatThreeDigitPrecision(double value)
{
    //print three digits: 0,01 | 0,11 | 1,11 | 11,1 | 111
    if (std::abs(value) < 9.995) //9.999 must not be formatted as "10.00"
        return printNumber<std::wstring>(L"%.2f", value);
    if (std::abs(value) < 99.95) //99.99 must not be formatted as "100.0"
        return printNumber<std::wstring>(L"%.1f", value);

    return formatNumber(std::llround(value));
}


std::wstring zen::formatFilesizeShort(int64_t size)
{
    if (std::abs(size) <= 999)
        return _P("1 byte", "%x bytes", static_cast<int>(size));

    double sizeInUnit = static_cast<double>(size);

    for (const wchar_t* unitTxt : {L"%x KB", L"%x MB", L"%x GB", L"%x TB"})
    {
        sizeInUnit /= bytesPerKilo;
        if (std::abs(sizeInUnit) < 999.5)
            return replaceCpy(translate(unitTxt), L"%x", formatThreeDigitPrecision(sizeInUnit));
    }

    sizeInUnit /= bytesPerKilo;
    return replaceCpy(_("%x PB"), L"%x", formatThreeDigitPrecision(sizeInUnit));
}


std::wstring zen::formatProgressPercent(double fraction)
{
    const double percent = std::clamp(fraction, 0.0, 1.0) * 100;
    return printNumber<std::wstring>(L"%.0f", std::floor(percent)) + L'%';
}


std::wstring zen::formatNumber(int64_t n)
{
    static_assert(sizeof(long long int) == sizeof(n));
    return printNumber<std::wstring>(L"%'lld", n); //considers grouping (') if locale is set
}
