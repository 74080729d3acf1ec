#ifndef MINT_KEYS
#define MINT_KEYS

#include <Mint/types.hpp>

namespace Mint {

    struct key_pair {
        secp256k1::secret Secret;
        secp256k1::pubkey Pubkey;

        key_pair () : Secret {}, Pubkey {} {}
        explicit key_pair (const secp256k1::secret &x) : Secret {x}, Pubkey {x.to_public ()} {}

        bool valid () const {
            return Secret.valid () && Pubkey.valid ();
        }
    };

    // maps an index to a key pair.
    struct key_service {
        virtual key_pair derive (uint32 index) const = 0;
        virtual ~key_service () {}
    };

    // keys for a simulation. Anyone who knows the seed knows every key.
    struct deterministic_keys final : key_service {
        uint64 Seed;

        deterministic_keys (uint64 seed) : Seed {seed} {}

        key_pair derive (uint32 index) const final override;
    };

}

#endif
