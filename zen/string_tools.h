// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <charconv>
#include <cstdio>
#include <cwchar>
#include <string>
#include <string_view>
#include <vector>


//enhance *any* std::basic_string<> with some convenience functions
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only
template <class Char> Char asciiToLower(Char c);

template <class S> using CharOf = typename S::value_type;
template <class S> using ViewOf = std::basic_string_view<CharOf<S>>;

template <class S> bool contains  (const S& str, ViewOf<S> term);
template <class S> bool contains  (const S& str, CharOf<S> c);
template <class S> bool startsWith(const S& str, ViewOf<S> prefix);
template <class S> bool startsWith(const S& str, CharOf<S> c);
template <class S> bool endsWith  (const S& str, ViewOf<S> postfix);
template <class S> bool endsWith  (const S& str, CharOf<S> c);

template <class S> bool equalAsciiNoCase(const S& lhs, ViewOf<S> rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S> S afterLast  (const S& str, ViewOf<S> term, IfNotFoundReturn infr);
template <class S> S beforeLast (const S& str, ViewOf<S> term, IfNotFoundReturn infr);
template <class S> S afterFirst (const S& str, ViewOf<S> term, IfNotFoundReturn infr);
template <class S> S beforeFirst(const S& str, ViewOf<S> term, IfNotFoundReturn infr);

template <class S> S afterLast  (const S& str, CharOf<S> c, IfNotFoundReturn infr) { return afterLast  (str, ViewOf<S>(&c, 1), infr); }
template <class S> S beforeLast (const S& str, CharOf<S> c, IfNotFoundReturn infr) { return beforeLast (str, ViewOf<S>(&c, 1), infr); }
template <class S> S afterFirst (const S& str, CharOf<S> c, IfNotFoundReturn infr) { return afterFirst (str, ViewOf<S>(&c, 1), infr); }
template <class S> S beforeFirst(const S& str, CharOf<S> c, IfNotFoundReturn infr) { return beforeFirst(str, ViewOf<S>(&c, 1), infr); }

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class Function> void split(const S& str, CharOf<S> delimiter, Function onStringPart);
template <class S> [[nodiscard]] std::vector<S> splitCpy(const S& str, CharOf<S> delimiter, SplitOnEmpty soe);

template <class S> [[nodiscard]] S trimCpy(const S& str);

template <class S> [[nodiscard]] S replaceCpy(S str, ViewOf<S> oldTerm, ViewOf<S> newTerm);
template <class S> [[nodiscard]] S replaceCpy(S str, ViewOf<S> oldTerm, CharOf<S> newChar) { return replaceCpy(std::move(str), oldTerm, ViewOf<S>(&newChar, 1)); }

template <class S, class Num> S   numberTo(const Num& number);
template <class Num, class S> Num stringTo(const S& str);

template <class S, class Num> S printNumber(const CharOf<S>* format, const Num& number); //format a single number using std::snprintf()

std::string formatAsHexString(std::string_view blob); //bytes -> lower-case hex string








//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    return c == static_cast<Char>(' ')  || c == static_cast<Char>('\t') ||
           c == static_cast<Char>('\n') || c == static_cast<Char>('\r') ||
           c == static_cast<Char>('\v') || c == static_cast<Char>('\f');
}


template <class Char> inline
bool isDigit(Char c) { return static_cast<Char>('0') <= c && c <= static_cast<Char>('9'); }


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class S> inline bool contains  (const S& str, ViewOf<S> term) { return ViewOf<S>(str).find(term) != ViewOf<S>::npos; }
template <class S> inline bool contains  (const S& str, CharOf<S> c)    { return str.find(c) != S::npos; }
template <class S> inline bool startsWith(const S& str, ViewOf<S> prefix) { return ViewOf<S>(str).starts_with(prefix); }
template <class S> inline bool startsWith(const S& str, CharOf<S> c)      { return ViewOf<S>(str).starts_with(c); }
template <class S> inline bool endsWith  (const S& str, ViewOf<S> postfix) { return ViewOf<S>(str).ends_with(postfix); }
template <class S> inline bool endsWith  (const S& str, CharOf<S> c)       { return ViewOf<S>(str).ends_with(c); }


template <class S> inline
bool equalAsciiNoCase(const S& lhs, ViewOf<S> rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    for (size_t i = 0; i < lhs.size(); ++i)
        if (asciiToLower(lhs[i]) != asciiToLower(rhs[i]))
            return false;
    return true;
}


template <class S> inline
S afterLast(const S& str, ViewOf<S> term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = ViewOf<S>(str).rfind(term);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return str.substr(pos + term.size());
}


template <class S> inline
S beforeLast(const S& str, ViewOf<S> term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = ViewOf<S>(str).rfind(term);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return str.substr(0, pos);
}


template <class S> inline
S afterFirst(const S& str, ViewOf<S> term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = ViewOf<S>(str).find(term);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return str.substr(pos + term.size());
}


template <class S> inline
S beforeFirst(const S& str, ViewOf<S> term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = ViewOf<S>(str).find(term);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return str.substr(0, pos);
}


template <class S, class Function> inline
void split(const S& str, CharOf<S> delimiter, Function onStringPart)
{
    size_t blockStart = 0;
    for (;;)
    {
        const size_t blockEnd = str.find(delimiter, blockStart);
        if (blockEnd == S::npos)
        {
            onStringPart(str.substr(blockStart));
            return;
        }
        onStringPart(str.substr(blockStart, blockEnd - blockStart));
        blockStart = blockEnd + 1;
    }
}


template <class S> inline
std::vector<S> splitCpy(const S& str, CharOf<S> delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    split(str, delimiter, [&](S&& part)
    {
        if (!part.empty() || soe == SplitOnEmpty::allow)
            output.push_back(std::move(part));
    });
    return output;
}


template <class S> inline
S trimCpy(const S& str)
{
    auto first = str.begin();
    auto last  = str.end();
    while (first != last && isWhiteSpace(*first))
        ++first;
    while (last != first && isWhiteSpace(*(last - 1)))
        --last;
    return S(first, last);
}


template <class S> inline
S replaceCpy(S str, ViewOf<S> oldTerm, ViewOf<S> newTerm)
{
    assert(!oldTerm.empty());
    if (oldTerm.empty())
        return str;

    for (size_t pos = str.find(oldTerm); pos != S::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    char buffer[64] = {};
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(rv.ec == std::errc());
    return S(std::begin(buffer), rv.ptr); //ASCII only => char-wise copy works for wide strings, too
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_arithmetic_v<Num>);
    std::string ascii;
    for (const auto c : str)
        if (!isWhiteSpace(c))
            ascii += static_cast<char>(c);

    Num number = 0;
    const char* first = ascii.c_str();
    if (!ascii.empty() && ascii[0] == '+')
        ++first;
    [[maybe_unused]] const std::from_chars_result rv = std::from_chars(first, ascii.c_str() + ascii.size(), number);
    return number; //return 0 on parse error, like std::atoi
}


template <class S, class Num> inline
S printNumber(const CharOf<S>* format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    CharOf<S> buffer[128] = {};
    int charsWritten = 0;
    if constexpr (std::is_same_v<CharOf<S>, wchar_t>)
        charsWritten = std::swprintf(buffer, std::size(buffer), format, number);
    else
        charsWritten = std::snprintf(buffer, std::size(buffer), format, number);
    return charsWritten > 0 ? S(buffer, charsWritten) : S();
}


inline
std::string formatAsHexString(std::string_view blob)
{
    const char digits[] = "0123456789abcdef";
    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        output += digits[static_cast<unsigned char>(c) >> 4];
        output += digits[static_cast<unsigned char>(c) & 0xf];
    }
    return output;
}
}

#endif //STRING_TOOLS_H_213458973046
