#pragma once

#include "utils.hpp"

namespace cidgen
{
    // Keyed signing capability used by keyed_cid_generator.  A crypto backend supplies the concrete
    // key (see gnutls_crypto.hpp); the generator only ever holds it through a shared_ptr<const>.
    //
    // Implementations must allow concurrent calls to sign() on the same object.
    class hmac_key
    {
      public:
        virtual ~hmac_key() = default;

        // Number of bytes written by sign()
        virtual size_t signature_len() const = 0;

        // Writes exactly signature_len() bytes of the keyed hash of `data` into `out`.
        virtual void sign(ustring_view data, uint8_t* out) const = 0;
    };

}  // namespace cidgen
