#pragma once

#include <stdexcept>

#include "utils.hpp"

namespace cidgen::opt
{
    using namespace std::chrono_literals;

    // Length of the IDs emitted by a random_cid_generator.  QUIC caps connection IDs at 20 bytes;
    // a length of 0 is permitted (and then every ID is the empty ID, so the connection manager must
    // rely on the peer address instead).
    struct cid_length
    {
        size_t length{DEFAULT_CID_LEN};
        cid_length() = default;
        explicit cid_length(size_t l) : length{l}
        {
            if (length > MAX_CID_LEN)
                throw std::out_of_range{"opt::cid_length must be at most " + std::to_string(MAX_CID_LEN)};
        }
    };

    // Advertised lifetime of issued IDs: the connection manager should retire an ID once it has
    // been in use for this long.  The generators only report it; nothing here enforces it.  If not
    // given, IDs never expire by policy.
    struct cid_lifetime
    {
        std::chrono::milliseconds lifetime;
        explicit cid_lifetime(std::chrono::milliseconds d) : lifetime{d} {}
    };

    // Secret used to key a keyed_cid_generator.  Every process that needs to validate the same IDs
    // must be given the same secret.  As with any MAC key you should use a dedicated random value
    // (or a keyed hash of one) here rather than reusing a private key.
    struct hmac_secret
    {
        inline static constexpr size_t SECRET_MIN_SIZE = 16;

        ustring secret;
        explicit hmac_secret(ustring s) : secret{std::move(s)}
        {
            if (secret.size() < SECRET_MIN_SIZE)
                throw std::invalid_argument{
                        "opt::hmac_secret requires data of at least " + std::to_string(SECRET_MIN_SIZE) + " bytes"};
        }
    };

}  // namespace cidgen::opt
