#ifndef MINT_TYPES
#define MINT_TYPES

#include <data/tools.hpp>
#include <data/math.hpp>
#include <data/numbers.hpp>
#include <data/net/JSON.hpp>
#include <data/crypto/hash.hpp>
#include <data/io/exception.hpp>
#include <gigamonkey/types.hpp>
#include <gigamonkey/secp256k1.hpp>
#include <gigamonkey/timestamp.hpp>

#include <chrono>

namespace Mint {
    using namespace data;
    namespace Bitcoin = Gigamonkey::Bitcoin;
    namespace secp256k1 = Gigamonkey::secp256k1;
    using digest256 = Gigamonkey::digest256;
    using timestamp = Bitcoin::timestamp;
    using seconds = std::chrono::seconds;

    // value held by a coin, in the smallest indivisible unit.
    using amount = uint64;

    // scripts and their arguments are opaque programs which
    // only the ledger knows how to evaluate.
    using program = JSON;

    digest256 tree_hash (const program &);

    std::string write (const digest256 &);
    digest256 read_digest (const JSON &);

    // raw bytes to be hashed into an identifier.
    struct preimage {
        std::string Bytes;

        preimage &operator << (const digest256 &);
        // 8 bytes, big endian.
        preimage &operator << (uint64);
        preimage &operator << (const std::string &);

        digest256 hash () const;
    };

}

#endif
