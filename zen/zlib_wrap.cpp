// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "zlib_wrap.h"
#include <cstring>
#include <zlib.h>
#include "scope_guard.h"

using namespace zen;


namespace
{
std::wstring getZlibErrorLiteral(int sc)
{
    switch (sc)
    {
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_NEED_DICT);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_STREAM_END);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_OK);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_ERRNO);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_STREAM_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_DATA_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_MEM_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_BUF_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_VERSION_ERROR);

        default:
            return replaceCpy<std::wstring>(L"zlib error %x", L"%x", numberTo<std::wstring>(sc));
    }
}
}


#undef compress //mitigate zlib macro shit...

std::string zen::compress(const std::string_view& stream, int level) //throw SysError
{
    std::string output;
    if (stream.empty()) //don't dereference iterator into empty container!
        return output;

    //save uncompressed stream size for decompression
    const uint64_t uncompressedSize = stream.size(); //use portable number type!

    uLongf bufSize = ::compressBound(static_cast<uLong>(stream.size())); //upper limit for buffer size, larger than input size!!!
    output.resize(sizeof(uncompressedSize) + bufSize);
    std::memcpy(output.data(), &uncompressedSize, sizeof(uncompressedSize));

    const int rv = ::compress2(reinterpret_cast<Bytef*>(output.data() + sizeof(uncompressedSize)), //Bytef* dest
                               &bufSize,                                         //uLongf* destLen
                               reinterpret_cast<const Bytef*>(stream.data()),    //const Bytef* source
                               static_cast<uLong>(stream.size()),                //uLong sourceLen
                               level);                                           //int level
    // Z_OK: success
    // Z_MEM_ERROR: not enough memory
    // Z_BUF_ERROR: not enough room in the output buffer
    if (rv != Z_OK || sizeof(uncompressedSize) + bufSize > output.size())
        throw SysError(formatSystemError("zlib compress2", getZlibErrorLiteral(rv), L""));

    output.resize(sizeof(uncompressedSize) + bufSize);
    return output;
}


std::string zen::decompress(const std::string_view& stream) //throw SysError
{
    std::string output;
    if (stream.empty()) //don't dereference iterator into empty container!
        return output;

    //retrieve size of uncompressed data
    uint64_t uncompressedSize = 0; //use portable number type!
    if (stream.size() < sizeof(uncompressedSize))
        throw SysError(L"zlib error: stream size < 8");

    std::memcpy(&uncompressedSize, stream.data(), sizeof(uncompressedSize));

    //attention: output MUST NOT be empty! Else it will pass a nullptr to uncompress() => Z_STREAM_ERROR although "uncompressedSize == 0"!!!
    if (uncompressedSize == 0) //cannot be 0: compress() directly maps empty -> empty container skipping zlib!
        throw SysError(L"zlib error: uncompressed size == 0");

    try
    {
        output.resize(static_cast<size_t>(uncompressedSize)); //throw std::bad_alloc
    }
    //most likely this is due to data corruption:
    catch (const std::length_error& e) { throw SysError(L"zlib error: " + _("Out of memory.") + L' ' + utfTo<std::wstring>(e.what())); }
    catch (const    std::bad_alloc& e) { throw SysError(L"zlib error: " + _("Out of memory.") + L' ' + utfTo<std::wstring>(e.what())); }

    uLongf bufSize = static_cast<uLong>(output.size());
    const int rv = ::uncompress(reinterpret_cast<Bytef*>(output.data()),                                     //Bytef* dest
                                &bufSize,                                                                   //uLongf* destLen
                                reinterpret_cast<const Bytef*>(stream.data() + sizeof(uncompressedSize)),   //const Bytef* source
                                static_cast<uLong>(stream.size() - sizeof(uncompressedSize)));              //uLong sourceLen
    // Z_DATA_ERROR: input data was corrupted or incomplete
    if (rv != Z_OK)
        throw SysError(formatSystemError("zlib uncompress", getZlibErrorLiteral(rv), L""));

    if (bufSize != output.size())
        throw SysError(formatSystemError("zlib uncompress", L"", L"bytes written != uncompressed size."));

    return output;
}
