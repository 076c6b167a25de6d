#pragma once

extern "C"
{
#include <gnutls/crypto.h>
#include <gnutls/gnutls.h>
}

#include "cid_generator.hpp"
#include "hmac_key.hpp"
#include "opt.hpp"

namespace cidgen
{
    // HMAC key backed by gnutls.  gnutls_hmac_fast keeps no state between calls, so a single key can
    // sign from any number of threads at once.
    class gnutls_hmac_key final : public hmac_key
    {
        gnutls_hmac_key(ustring secret, gnutls_mac_algorithm_t algo);

      public:
        // Size of the secret generated by make_random()
        static constexpr size_t RANDOM_SECRET_SIZE = 64;

        ~gnutls_hmac_key() override;

        gnutls_hmac_key(const gnutls_hmac_key&) = delete;
        gnutls_hmac_key& operator=(const gnutls_hmac_key&) = delete;

        size_t signature_len() const override { return _sig_len; }

        // Throws std::runtime_error if gnutls fails to compute the MAC
        void sign(ustring_view data, uint8_t* out) const override;

        gnutls_mac_algorithm_t algorithm() const { return _algo; }

        // Throws std::invalid_argument unless `algo` is one of gnutls' HMACs (MD5, SHA1, RMD160, SHA224,
        // SHA256, SHA384, SHA512) and gnutls is able to compute it.
        static std::shared_ptr<gnutls_hmac_key> make(opt::hmac_secret secret, gnutls_mac_algorithm_t algo = GNUTLS_MAC_SHA256);

        // Same as above, but keyed with RANDOM_SECRET_SIZE fresh random bytes
        static std::shared_ptr<gnutls_hmac_key> make_random(gnutls_mac_algorithm_t algo = GNUTLS_MAC_SHA256);

      private:
        ustring _secret;
        gnutls_mac_algorithm_t _algo;
        size_t _sig_len;
    };

    // Builds a keyed_cid_generator over an HMAC-SHA256 gnutls key.  If no secret is given a random
    // one is generated, in which case only this generator (and copies of it) can validate the IDs.
    keyed_cid_generator make_keyed_generator(
            std::optional<opt::hmac_secret> secret = std::nullopt, std::optional<opt::cid_lifetime> lifetime = std::nullopt);

}  // namespace cidgen
