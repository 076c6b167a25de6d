#include "gnutls_crypto.hpp"

#include "internal.hpp"

namespace cidgen
{
    // The MACs gnutls_hmac_fast can compute from an arbitrary-length key and no nonce.  CMAC wants a
    // fixed key size and GMAC/UMAC need a nonce; gnutls aborts if asked to sign with those here.
    static bool is_hmac_algorithm(gnutls_mac_algorithm_t algo)
    {
        switch (algo)
        {
            case GNUTLS_MAC_MD5:
            case GNUTLS_MAC_SHA1:
            case GNUTLS_MAC_RMD160:
            case GNUTLS_MAC_SHA224:
            case GNUTLS_MAC_SHA256:
            case GNUTLS_MAC_SHA384:
            case GNUTLS_MAC_SHA512:
                return true;
            default:
                return false;
        }
    }

    gnutls_hmac_key::gnutls_hmac_key(ustring secret, gnutls_mac_algorithm_t algo) :
            _secret{std::move(secret)}, _algo{algo}, _sig_len{gnutls_hmac_get_len(algo)}
    {
        if (!is_hmac_algorithm(algo) || _sig_len == 0)
        {
            log::warning(log_cat, "gnutls MAC algorithm {} is not a usable HMAC", static_cast<int>(algo));
            throw std::invalid_argument{"gnutls_hmac_key requires an HMAC algorithm"};
        }

        // One trial MAC so that a backend refusal (e.g. MD5 under FIPS mode) surfaces here rather than
        // on the first generate()
        ustring trial(_sig_len, 0);
        if (auto rv = gnutls_hmac_fast(_algo, _secret.data(), _secret.size(), "", 0, trial.data()); rv < 0)
        {
            log::warning(log_cat, "gnutls refused {} HMAC: {}", gnutls_mac_get_name(algo), gnutls_strerror(rv));
            throw std::invalid_argument{"gnutls cannot compute the requested HMAC: "s + gnutls_strerror(rv)};
        }

        log::trace(log_cat, "Initialized gnutls {} key ({}-byte signatures)", gnutls_mac_get_name(algo), _sig_len);
    }

    gnutls_hmac_key::~gnutls_hmac_key()
    {
        gnutls_memset(_secret.data(), 0, _secret.size());
    }

    void gnutls_hmac_key::sign(ustring_view data, uint8_t* out) const
    {
        if (auto rv = gnutls_hmac_fast(_algo, _secret.data(), _secret.size(), data.data(), data.size(), out); rv < 0)
        {
            log::error(log_cat, "gnutls_hmac_fast failed: {}", gnutls_strerror(rv));
            throw std::runtime_error{"gnutls HMAC computation failed"};
        }
    }

    std::shared_ptr<gnutls_hmac_key> gnutls_hmac_key::make(opt::hmac_secret secret, gnutls_mac_algorithm_t algo)
    {
        // would use make_shared, but the constructor is private
        std::shared_ptr<gnutls_hmac_key> p{new gnutls_hmac_key(std::move(secret.secret), algo)};
        return p;
    }

    std::shared_ptr<gnutls_hmac_key> gnutls_hmac_key::make_random(gnutls_mac_algorithm_t algo)
    {
        ustring secret(RANDOM_SECRET_SIZE, 0);
        random_bytes(secret.data(), secret.size());
        return make(opt::hmac_secret{std::move(secret)}, algo);
    }

    keyed_cid_generator make_keyed_generator(std::optional<opt::hmac_secret> secret, std::optional<opt::cid_lifetime> lifetime)
    {
        auto key = secret ? gnutls_hmac_key::make(std::move(*secret)) : gnutls_hmac_key::make_random();
        return keyed_cid_generator{std::move(key), std::move(lifetime)};
    }

}  // namespace cidgen
