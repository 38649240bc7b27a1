// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CRC_H_23489275827847235
#define CRC_H_23489275827847235

#include <cstdint>
#include <string_view>
#include <boost/crc.hpp>


namespace zen
{
//CRC-16: short unique name parts; CRC-32: stream integrity trailers
uint16_t getCrc16(std::string_view bytes);
uint32_t getCrc32(std::string_view bytes);

//incremental CRC-32 for data arriving in blocks
class Crc32Accumulator
{
public:
    void update(const void* buffer, size_t bytes) { if (bytes > 0) crc_.process_bytes(buffer, bytes); }
    uint32_t checksum() const { return crc_.checksum(); }

private:
    boost::crc_32_type crc_;
};




//------------------------- implementation -------------------------------
inline
uint16_t getCrc16(std::string_view bytes)
{
    boost::crc_16_type result;
    if (!bytes.empty())
        result.process_bytes(bytes.data(), bytes.size());
    auto rv = result.checksum();
    static_assert(sizeof(rv) == sizeof(uint16_t));
    return rv;
}


inline
uint32_t getCrc32(std::string_view bytes)
{
    Crc32Accumulator acc;
    acc.update(bytes.data(), bytes.size());
    return acc.checksum();
}
}

#endif //CRC_H_23489275827847235
