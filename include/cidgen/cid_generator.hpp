#pragma once

#include <memory>

#include "connection_id.hpp"
#include "error.hpp"
#include "hmac_key.hpp"
#include "opt.hpp"

namespace cidgen
{
    // Generates the connection IDs we hand out for inbound connections.
    //
    // IDs MUST NOT contain anything an external observer (one not cooperating with the issuer) could
    // use to correlate them with other IDs issued for the same connection.
    //
    // generate() consumes fresh randomness and must not be called concurrently on one instance;
    // everything else is const and safe to call from multiple threads once the generator is
    // published.
    class cid_generator
    {
      public:
        virtual ~cid_generator() = default;

        // Produces a new connection ID of cid_len() bytes
        virtual connection_id generate() = 0;

        // Length of every ID this generator produces; constant for the generator's lifetime
        virtual size_t cid_len() const = 0;

        // How long an issued ID may be used before the connection manager should retire it, or
        // nullopt if IDs never expire.  Assumed to be constant.
        virtual std::optional<std::chrono::milliseconds> lifetime() const = 0;

        // Quickly determines whether `cid` could have been issued by this generator.  False
        // positives are allowed (they only mean a bogus packet gets further before being dropped);
        // rejecting an ID that we did issue is a bug.  The default accepts everything.
        virtual validation_result validate(const connection_id& cid) const;
    };

    // Generates purely random connection IDs of a fixed length.
    //
    // Random IDs can be shorter than those of keyed_cid_generator, but cannot be usefully
    // validated: validate() accepts any input.
    class random_cid_generator final : public cid_generator
    {
      public:
        // Takes any of opt::cid_length, opt::cid_lifetime (or std::optional-wrapped versions of
        // them).  Defaults to DEFAULT_CID_LEN byte IDs that never expire.
        template <typename... Opt>
            requires(!(std::is_same_v<remove_cvref_t<Opt>, random_cid_generator> || ...))
        explicit random_cid_generator(Opt&&... opts)
        {
            ((void)handle_gen_opt(std::forward<Opt>(opts)), ...);
            _log_created();
        }

        connection_id generate() override;

        size_t cid_len() const override { return _len; }

        std::optional<std::chrono::milliseconds> lifetime() const override { return _lifetime; }

        random_cid_generator& set_lifetime(std::chrono::milliseconds d)
        {
            _lifetime = d;
            return *this;
        }

      private:
        size_t _len{DEFAULT_CID_LEN};
        std::optional<std::chrono::milliseconds> _lifetime;

        void handle_gen_opt(opt::cid_length l) { _len = l.length; }
        void handle_gen_opt(opt::cid_lifetime l) { _lifetime = l.lifetime; }

        template <typename Opt>
        void handle_gen_opt(std::optional<Opt> option)
        {
            if (option)
                handle_gen_opt(std::move(*option));
        }

        void _log_created() const;
    };

    // Generates 8-byte connection IDs that can be validated without keeping any record of the IDs
    // handed out.
    //
    // Each ID is a NONCE_LEN-byte random nonce followed by the first SIGNATURE_LEN bytes of the
    // key's signature of that nonce.  Validation recomputes the signature, so any process holding
    // the same key can recognize IDs issued by any other.  A forged ID is accepted with probability
    // 2^-(8*SIGNATURE_LEN).
    //
    // These lengths are visible on the wire: cooperating processes must agree on them.
    class keyed_cid_generator final : public cid_generator
    {
      public:
        // 2^24 nonces: good for more than 16 million connections
        static constexpr size_t NONCE_LEN = 3;
        static constexpr size_t SIGNATURE_LEN = 5;
        static constexpr size_t CID_LEN = NONCE_LEN + SIGNATURE_LEN;
        // Upper bound (exclusive) on the raw signature length of a usable key; sets the size of the
        // scratch buffer the signature is produced into.
        static constexpr size_t MAX_SIGNATURE_LEN = 128;

        static_assert(CID_LEN <= MAX_CID_LEN);

        // Throws std::invalid_argument if `key` is null or its signature_len() is not in
        // [SIGNATURE_LEN, MAX_SIGNATURE_LEN).  Also takes an optional opt::cid_lifetime.
        template <typename... Opt>
        explicit keyed_cid_generator(std::shared_ptr<const hmac_key> key, Opt&&... opts) : _key{std::move(key)}
        {
            _check_key();
            ((void)handle_gen_opt(std::forward<Opt>(opts)), ...);
        }

        connection_id generate() override;

        size_t cid_len() const override { return CID_LEN; }

        std::optional<std::chrono::milliseconds> lifetime() const override { return _lifetime; }

        validation_result validate(const connection_id& cid) const override;

        keyed_cid_generator& set_lifetime(std::chrono::milliseconds d)
        {
            _lifetime = d;
            return *this;
        }

        const std::shared_ptr<const hmac_key>& key() const { return _key; }

      private:
        std::shared_ptr<const hmac_key> _key;
        std::optional<std::chrono::milliseconds> _lifetime;

        void handle_gen_opt(opt::cid_lifetime l) { _lifetime = l.lifetime; }

        template <typename Opt>
        void handle_gen_opt(std::optional<Opt> option)
        {
            if (option)
                handle_gen_opt(std::move(*option));
        }

        void _check_key() const;
    };

}  // namespace cidgen
