#include "connection_id.hpp"

#include <oxenc/hex.h>

#include "internal.hpp"

namespace cidgen
{
    connection_id::connection_id(const uint8_t* data, size_t length)
    {
        if (length > MAX_CID_LEN)
            throw std::invalid_argument{"Connection ID of {} bytes exceeds the {}-byte maximum"_format(length, MAX_CID_LEN)};
        _cid.datalen = length;
        if (length)
            std::memcpy(_cid.data, data, length);
    }

    std::string connection_id::to_string() const
    {
        return oxenc::to_hex(data(), data() + size());
    }

    connection_id connection_id::from_hex(std::string_view hex)
    {
        if (!oxenc::is_hex(hex))
            throw std::invalid_argument{"Invalid connection ID '{}': expected an even number of hex digits"_format(hex)};
        if (hex.size() / 2 > MAX_CID_LEN)
            throw std::invalid_argument{"Invalid connection ID '{}': longer than {} bytes"_format(hex, MAX_CID_LEN)};

        connection_id cid;
        cid._cid.datalen = hex.size() / 2;
        oxenc::from_hex(hex.begin(), hex.end(), cid._cid.data);
        return cid;
    }

}  // namespace cidgen
