#pragma once

#include <CLI/CLI.hpp>
#include <cidgen.hpp>
#include <oxen/log.hpp>
#include <oxenc/base64.h>
#include <oxenc/hex.h>

#include <optional>
#include <string>

namespace cidgen
{
    namespace log = oxen::log;

    inline auto test_cat = oxen::log::Cat("test");

    namespace test
    {
        // Stand-in signing key with an arbitrary advertised signature length, for exercising the
        // keyed generator's key checks.  The "signature" is the input bytes repeated, so it is
        // deterministic but (obviously) not secure.
        struct fake_key : hmac_key
        {
            size_t len;
            explicit fake_key(size_t len) : len{len} {}

            size_t signature_len() const override { return len; }

            void sign(ustring_view data, uint8_t* out) const override
            {
                for (size_t i = 0; i < len; i++)
                    out[i] = data.empty() ? 0 : data[i % data.size()];
            }
        };

        // Fixed 32-byte secret so that tests needing two processes to share a key can build two
        // keys from it.
        inline const ustring SHARED_SECRET = oxenc::from_hex<unsigned char>(
                "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"sv);
    }  // namespace test

    // Takes a hex- or base64-encoded byte value and returns the bytes.  Returns nullopt if the
    // value is neither.
    template <typename Char = char>
    inline std::optional<std::basic_string<Char>> decode_bytes(std::string_view encoded)
    {
        if (encoded.size() % 2 == 0 && oxenc::is_hex(encoded))
            return oxenc::from_hex<Char>(encoded);
        if (oxenc::is_base64(encoded))
            return oxenc::from_base64<Char>(encoded);
        return std::nullopt;
    }

    void add_log_opts(CLI::App& cli, std::string& file, std::string& level);

    void setup_logging(std::string out, const std::string& level);

    /// RAII class that resets the log level for the given category while the object is alive, then
    /// resets it to what it was at construction when the object is destroyed.
    struct log_level_override
    {
        log::Level previous;
        std::string category;
        log_level_override(log::Level l, std::string cat = "cidgen") :
                previous{log::get_level(cat)}, category{std::move(cat)}
        {
            log::set_level(category, l);
        }
        ~log_level_override() { log::set_level(category, previous); }
    };

    /// Same as above, but only raises the log level to a more serious cutoff (leaving it alone if
    /// already higher).  Handy around loops that would otherwise emit thousands of trace lines.
    struct log_level_raiser : log_level_override
    {
        log_level_raiser(log::Level l, std::string category = "cidgen") :
                log_level_override{std::max(l, log::get_level(category)), category}
        {}
    };

}  // namespace cidgen
