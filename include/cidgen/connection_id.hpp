#pragma once

#include <algorithm>
#include <functional>

#include "utils.hpp"

namespace cidgen
{
    // Immutable QUIC connection ID of 0 to MAX_CID_LEN bytes.  Storage is an ngtcp2_cid so that
    // an ID can be handed to ngtcp2 without copying; unused trailing bytes are always zero.
    struct connection_id final
    {
        connection_id() = default;
        connection_id(const uint8_t* data, size_t length);
        explicit connection_id(ustring_view data) : connection_id{data.data(), data.size()} {}
        explicit connection_id(const ngtcp2_cid& c) : connection_id{c.data, c.datalen} {}

        connection_id(const connection_id&) = default;
        connection_id& operator=(const connection_id&) = default;

        size_t size() const { return _cid.datalen; }
        bool empty() const { return _cid.datalen == 0; }
        const uint8_t* data() const { return _cid.data; }
        ustring_view view() const { return {_cid.data, _cid.datalen}; }

        // i must be < size(); no bounds check
        const uint8_t& operator[](size_t i) const { return _cid.data[i]; }

        const ngtcp2_cid* ngtcp2() const { return &_cid; }

        bool operator==(const connection_id& other) const
        {
            return size() == other.size() && std::memcmp(data(), other.data(), size()) == 0;
        }
        bool operator!=(const connection_id& other) const { return !(*this == other); }
        bool operator<(const connection_id& other) const
        {
            return std::lexicographical_compare(data(), data() + size(), other.data(), other.data() + other.size());
        }

        // Lowercase hex of the ID bytes
        std::string to_string() const;

        // Parses a hex-encoded connection ID; throws std::invalid_argument if the value is not
        // hex or decodes to more than MAX_CID_LEN bytes.
        static connection_id from_hex(std::string_view hex);

      private:
        ngtcp2_cid _cid{};
    };
}  // namespace cidgen

namespace std
{
    template <>
    struct hash<cidgen::connection_id>
    {
        size_t operator()(const cidgen::connection_id& cid) const
        {
            // IDs are random (or nonce-prefixed), so the leading bytes are already well mixed
            size_t h{0};
            std::memcpy(&h, cid.data(), std::min(sizeof(h), cidgen::MAX_CID_LEN));
            return h ^ cid.size();
        }
    };
}  // namespace std
