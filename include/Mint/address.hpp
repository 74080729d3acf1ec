#ifndef MINT_ADDRESS
#define MINT_ADDRESS

#include <Mint/types.hpp>

namespace Mint {

    // addresses are script hashes encoded in bech32m (BIP 350).
    namespace address {
        constexpr static const char *DefaultPrefix {"xch"};

        std::string encode (const digest256 &script_hash, const std::string &prefix = DefaultPrefix);

        struct decoded {
            std::string Prefix;
            digest256 ScriptHash;
        };

        // a script hash as hex in the byte order in which it is encoded,
        // with or without a leading 0x.
        maybe<digest256> read_hash (const std::string &);
        std::string write_hash (const digest256 &);

        // nothing if the checksum is wrong, the string is not bech32m,
        // or it does not encode 32 bytes.
        maybe<decoded> decode (const std::string &);
    }

}

#endif
