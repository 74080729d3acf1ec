#ifndef MINT_PROGRAM
#define MINT_PROGRAM

#include <Mint/coin.hpp>

namespace Mint {

    enum class opcode : uint32 {
        require_signature = 50,
        create_coin = 51,
        create_coin_announcement = 60,
        assert_coin_announcement = 61
    };

    std::ostream &operator << (std::ostream &, opcode);

    // an instruction emitted by the spend of a coin.
    struct condition {
        opcode Opcode;

        // script hash for create_coin, message for create_coin_announcement,
        // announcement id for assert_coin_announcement.
        digest256 Digest;

        // only for create_coin.
        amount Amount;

        // only for require_signature.
        secp256k1::pubkey Key;

        static condition create_coin (const digest256 &script_hash, amount);
        static condition create_coin_announcement (const digest256 &message);
        static condition assert_coin_announcement (const digest256 &announcement_id);
        static condition require_signature (const secp256k1::pubkey &);

        explicit condition (const JSON &);
        explicit operator JSON () const;

    private:
        condition (opcode op, const digest256 &d = {}, amount a = 0, const secp256k1::pubkey &k = {}) :
            Opcode {op}, Digest {d}, Amount {a}, Key {k} {}
    };

    using conditions = list<condition>;

    JSON write (conditions);
    conditions read_conditions (const JSON &);

    // the id that an assertion must name in order to find an
    // announcement made by the given coin.
    digest256 announcement_id (const digest256 &coin_id, const digest256 &message);

    // The standard script locks a coin to a public key. Its solution is
    // a list of delegated conditions which the owner of the key signs.
    program standard_script (const secp256k1::pubkey &);

    // nothing if the program is not a standard script.
    maybe<secp256k1::pubkey> read_standard_script (const program &);

    program standard_solution (conditions);

    conditions read_standard_solution (const program &);

}

#endif
