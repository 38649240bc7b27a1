// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>


namespace zen
{
//convert between UTF-8 (char) and UTF-32 (wchar_t on Linux)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

//number of code points in a UTF-8 string
size_t unicodeLength(std::string_view str);








//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;

const CodePoint REPLACEMENT_CHAR = 0xfffd;
const CodePoint CODE_POINT_MAX   = 0x10ffff;


inline
void codePointToUtf8(CodePoint cp, std::string& out)
{
    if (cp < 0x80)
        out += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xc0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xe0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp <= CODE_POINT_MAX)
    {
        out += static_cast<char>(0xf0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else
        codePointToUtf8(REPLACEMENT_CHAR, out);
}


//"onCodePoint" is called once per decoded code point; invalid sequences decode as REPLACEMENT_CHAR
template <class Function> inline
void utf8ToCodePoint(std::string_view str, Function onCodePoint)
{
    auto it = str.begin();
    while (it != str.end())
    {
        const auto lead = static_cast<unsigned char>(*it++);
        if (lead < 0x80)
        {
            onCodePoint(lead);
            continue;
        }

        size_t trailCount = 0;
        CodePoint cp = 0;
        if      ((lead >> 5) == 0x6) { trailCount = 1; cp = lead & 0x1f; }
        else if ((lead >> 4) == 0xe) { trailCount = 2; cp = lead & 0x0f; }
        else if ((lead >> 3) == 0x1e) { trailCount = 3; cp = lead & 0x07; }
        else
        {
            onCodePoint(REPLACEMENT_CHAR);
            continue;
        }

        bool valid = true;
        for (size_t i = 0; i < trailCount; ++i)
        {
            if (it == str.end() || (static_cast<unsigned char>(*it) >> 6) != 0x2)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(*it++) & 0x3f);
        }
        onCodePoint(valid && cp <= CODE_POINT_MAX ? cp : REPLACEMENT_CHAR);
    }
}


inline
std::wstring utf8ToWide(std::string_view str)
{
    std::wstring output;
    output.reserve(str.size());
    utf8ToCodePoint(str, [&](CodePoint cp) { output += static_cast<wchar_t>(cp); });
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());
    for (const wchar_t c : str)
        codePointToUtf8(static_cast<CodePoint>(c), output);
    return output;
}


template <class T> struct IsWide : std::false_type {};
template <> struct IsWide<std::wstring>      : std::true_type {};
template <> struct IsWide<std::wstring_view> : std::true_type {};
template <> struct IsWide<wchar_t*>          : std::true_type {};
template <> struct IsWide<const wchar_t*>    : std::true_type {};
template <size_t N> struct IsWide<wchar_t[N]>       : std::true_type {};
template <size_t N> struct IsWide<const wchar_t[N]> : std::true_type {};
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    constexpr bool sourceWide = impl::IsWide<std::remove_cvref_t<SourceString>>::value;
    constexpr bool targetWide = std::is_same_v<TargetString, std::wstring>;

    if constexpr (sourceWide == targetWide)
        return TargetString(str);
    else if constexpr (targetWide)
        return impl::utf8ToWide(str);
    else
        return impl::wideToUtf8(str);
}


inline
size_t unicodeLength(std::string_view str)
{
    size_t len = 0;
    impl::utf8ToCodePoint(str, [&](impl::CodePoint) { ++len; });
    return len;
}
}

#endif //UTF_H_01832479146991573473545
