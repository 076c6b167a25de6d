#include "cid_generator.hpp"

#include <array>

#include "internal.hpp"

namespace cidgen
{
    validation_result cid_generator::validate(const connection_id&) const
    {
        return {};
    }

    void random_cid_generator::_log_created() const
    {
        log::debug(
                log_cat,
                "Random CID generator created: length {}, lifetime {}",
                _len,
                _lifetime ? "{}ms"_format(_lifetime->count()) : "unlimited"s);
    }

    connection_id random_cid_generator::generate()
    {
        std::array<uint8_t, MAX_CID_LEN> buf;
        random_bytes(buf.data(), _len);

        connection_id cid{buf.data(), _len};
        log::trace(log_cat, "Generated random CID {}", cid);
        return cid;
    }

    void keyed_cid_generator::_check_key() const
    {
        if (!_key)
        {
            log::warning(log_cat, "Keyed CID generator constructed without a signing key");
            throw std::invalid_argument{"keyed_cid_generator requires a signing key"};
        }

        auto sig_len = _key->signature_len();
        if (sig_len >= MAX_SIGNATURE_LEN)
        {
            log::warning(log_cat, "Signing key produces {}-byte signatures (max {})", sig_len, MAX_SIGNATURE_LEN - 1);
            throw std::invalid_argument{
                    "keyed_cid_generator key must produce a signature of less than {} bytes"_format(MAX_SIGNATURE_LEN)};
        }
        if (sig_len < SIGNATURE_LEN)
        {
            log::warning(log_cat, "Signing key produces {}-byte signatures (min {})", sig_len, SIGNATURE_LEN);
            throw std::invalid_argument{
                    "keyed_cid_generator key must produce a signature of at least {} bytes"_format(SIGNATURE_LEN)};
        }

        log::debug(log_cat, "Keyed CID generator created: {}-byte key signatures, {}-byte CIDs", sig_len, CID_LEN);
    }

    connection_id keyed_cid_generator::generate()
    {
        // nonce || signature(nonce); only the first SIGNATURE_LEN bytes of the signature end up in
        // the ID, the rest of the buffer is scratch space for the full signature.
        std::array<uint8_t, NONCE_LEN + MAX_SIGNATURE_LEN> buf{};
        random_bytes(buf.data(), NONCE_LEN);
        _key->sign(ustring_view{buf.data(), NONCE_LEN}, buf.data() + NONCE_LEN);

        connection_id cid{buf.data(), CID_LEN};
        log::trace(log_cat, "Generated keyed CID {}", cid);
        return cid;
    }

    validation_result keyed_cid_generator::validate(const connection_id& cid) const
    {
        if (cid.size() != CID_LEN)
        {
            log::trace(log_cat, "Rejecting CID {}: length {} != {}", cid, cid.size(), CID_LEN);
            return validation_result::invalid(cid_error::bad_length);
        }

        std::array<uint8_t, MAX_SIGNATURE_LEN> expected{};
        _key->sign(ustring_view{cid.data(), NONCE_LEN}, expected.data());

        // Must be constant time: no early exit on the first mismatching byte
        if (gnutls_memcmp(expected.data(), cid.data() + NONCE_LEN, SIGNATURE_LEN) != 0)
        {
            log::trace(log_cat, "Rejecting CID {}: signature mismatch", cid);
            return validation_result::invalid(cid_error::bad_signature);
        }

        return {};
    }

}  // namespace cidgen
