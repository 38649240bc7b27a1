// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef I18_N_H_3843489325044253425456
#define I18_N_H_3843489325044253425456

#include <cstdint>
#include <cstdlib>
#include "string_tools.h"


//minimal layer marking user-visible text: no translation catalog is loaded
#define ZEN_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        zen::translate(ZEN_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) zen::translate(ZEN_TRANS_CONCAT_SUB(L, s), ZEN_TRANS_CONCAT_SUB(L, p), n)
//source and translation are required to use %x as number placeholder
//for plural form, which will be substituted automatically!!!

namespace zen
{
inline
std::wstring translate(const std::wstring& text) { return text; }


//translate plural forms: "%x file" "%x files"
template <class T> inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, T n)
{
    static_assert(sizeof(n) <= sizeof(int64_t));
    const auto n64 = static_cast<int64_t>(n);
    assert(contains(plural, L"%x"));
    return replaceCpy(std::abs(n64) == 1 ? singular : plural, L"%x", numberTo<std::wstring>(n64));
}
}

#endif //I18_N_H_3843489325044253425456
