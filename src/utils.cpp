#include "utils.hpp"

extern "C"
{
#include <gnutls/crypto.h>
}

#include <algorithm>
#include <array>
#include <atomic>

#include "internal.hpp"

namespace cidgen
{
    void random_bytes(uint8_t* dest, size_t size)
    {
        if (size == 0)
            return;

        if (auto rv = gnutls_rnd(GNUTLS_RND_RANDOM, dest, size); rv < 0)
        {
            log::critical(log_cat, "gnutls_rnd failed: {}", gnutls_strerror(rv));
            throw std::runtime_error{"Secure random source unavailable: "s + gnutls_strerror(rv)};
        }
    }

    void logger_config(std::string out, std::string_view level)
    {
        static std::atomic<bool> run_once{false};

        if (run_once.exchange(true))
            return;

        constexpr std::array print_vals = {"stdout", "-", "", "stderr", "nocolor", "stdout-nocolor", "stderr-nocolor"};
        log::Type type;
        if (std::count(print_vals.begin(), print_vals.end(), out))
            type = log::Type::Print;
        else if (out == "syslog")
            type = log::Type::System;
        else
            type = log::Type::File;

        log::add_sink(type, out);
        log::reset_level(log::level_from_string(std::string{level}));
    }

}  // namespace cidgen
