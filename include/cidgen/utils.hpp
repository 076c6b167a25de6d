#pragma once

extern "C"
{
#include <gnutls/gnutls.h>
#include <ngtcp2/ngtcp2.h>
}

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace cidgen
{
    using namespace std::literals;
    using ustring = std::basic_string<unsigned char>;
    using ustring_view = std::basic_string_view<unsigned char>;

    // Largest connection ID permitted by QUIC (RFC 9000, section 17.2); ngtcp2 sizes its cid
    // storage by the same constant.
    inline constexpr size_t MAX_CID_LEN = NGTCP2_MAX_CIDLEN;

    // Length of the random-only connection IDs we emit if nothing else is requested.
    inline constexpr size_t DEFAULT_CID_LEN = 8;

    // strang literals
    inline ustring operator""_us(const char* str, size_t len) noexcept
    {
        return {reinterpret_cast<const unsigned char*>(str), len};
    }
    inline ustring_view operator""_usv(const char* str, size_t len) noexcept
    {
        return {reinterpret_cast<const unsigned char*>(str), len};
    }

    template <typename T>
    using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

    // Fills `size` bytes at `dest` from the gnutls CSPRNG.  Throws std::runtime_error if the
    // random source is unavailable; we never hand out a partially filled buffer.
    void random_bytes(uint8_t* dest, size_t size);

    // Installs an oxen-logging sink; only the first call has any effect.
    void logger_config(std::string out = "stderr", std::string_view level = "info");

}  // namespace cidgen
