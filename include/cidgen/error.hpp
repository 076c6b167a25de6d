#pragma once

#include "utils.hpp"

namespace cidgen
{
    // Reasons a generator can give for refusing to recognize a connection ID.
    enum class cid_error : uint8_t
    {
        none = 0,
        // ID length does not match what the generator emits
        bad_length,
        // Embedded signature does not match the signature recomputed over the nonce
        bad_signature,
    };

    std::string_view cid_strerror(cid_error e);

    // Result of cid_generator::validate.  Default construction makes a "good" result; a rejected
    // ID carries the cid_error explaining why.  Rejection is an ordinary outcome (spoofed, stale or
    // foreign packets) and the caller is expected to drop the packet and carry on.
    struct validation_result
    {
        validation_result() = default;
        explicit validation_result(cid_error e) : error{e} {}

        static validation_result invalid(cid_error e) { return validation_result{e}; }

        cid_error error{cid_error::none};

        // Returns true if the ID was accepted
        bool success() const { return error == cid_error::none; }
        // Returns true if the ID was rejected
        bool failure() const { return !success(); }

        explicit operator bool() const { return success(); }

        std::string_view str_error() const { return cid_strerror(error); }
    };

}  // namespace cidgen
