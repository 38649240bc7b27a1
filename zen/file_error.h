// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ERROR_H_839567308565656789
#define FILE_ERROR_H_839567308565656789

#include "sys_error.h" //we'll need this later anyway!


namespace zen
{
class FileError //A high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::wstring& msg, ErrorCode ec = 0) : msg_(msg), errorCode_(ec) {}
    FileError(const std::wstring& msg, const std::wstring& details, ErrorCode ec = 0) : msg_(msg + L"\n\n" + details), errorCode_(ec) {}
    virtual ~FileError() {}

    const std::wstring& toString() const { return msg_; }
    ErrorCode errorCode() const { return errorCode_; } //underlying errno, 0 if n/a

private:
    std::wstring msg_;
    ErrorCode errorCode_ = 0;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public zen::FileError { \
        X(const std::wstring& msg, zen::ErrorCode ec = 0) : FileError(msg, ec) {} \
        X(const std::wstring& msg, const std::wstring& descr, zen::ErrorCode ec = 0) : FileError(msg, descr, ec) {} };

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting)
DEFINE_NEW_FILE_ERROR(ErrorFileLocked)
DEFINE_NEW_FILE_ERROR(ErrorMoveUnsupported)


//CAVEAT: evaluate errno *before* making any (indirect) system calls!
#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const ErrorCode ecInternal = getLastError(); throw FileError(msg, formatSystemError(functionName, ecInternal), ecInternal); } while (false)

//----------- facilitate usage of std::wstring for error messages --------------------

inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const Zstring& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
inline std::wstring fmtPath(const wchar_t* displayPath) { return fmtPath(std::wstring(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_839567308565656789
