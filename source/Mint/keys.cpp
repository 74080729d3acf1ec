#include <Mint/keys.hpp>

namespace Mint {

    key_pair deterministic_keys::derive (uint32 index) const {
        key_pair k {secp256k1::secret {uint256 {Seed + uint64 (index)}}};
        if (!k.valid ()) throw data::exception {} << "could not derive key " << index << " from seed " << Seed;
        return k;
    }

}
