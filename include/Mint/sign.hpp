#ifndef MINT_SIGN
#define MINT_SIGN

#include <Mint/program.hpp>
#include <Mint/keys.hpp>

namespace Mint {

    using signature = secp256k1::signature;

    // a spend record unlocks exactly one coin.
    struct spend {
        coin Coin;
        program Script;
        program Solution;

        spend (const coin &c, const program &script, const program &solution) :
            Coin {c}, Script {script}, Solution {solution} {}

        spend (const redeemable &r, const program &solution) :
            Coin {r}, Script {r.Script}, Solution {solution} {}

        explicit spend (const JSON &);
        explicit operator JSON () const;
    };

    // what is signed by a key that authorizes a spend.
    digest256 signature_message (const program &solution, const digest256 &coin_id, const digest256 &genesis);

    digest256 inline signature_message (const spend &x, const digest256 &genesis) {
        return signature_message (x.Solution, x.Coin.id (), genesis);
    }

    struct signed_spend {
        spend Spend;
        signature Signature;
    };

    signed_spend sign (const spend &, const secp256k1::secret &, const digest256 &genesis);

    // Signatures of all spends in a transaction collected together. The
    // ledger checks each required signature against this collection.
    struct aggregate_signature : list<signature> {
        using list<signature>::list;
        aggregate_signature (list<signature> x) : list<signature> {x} {}

        // whether any signature in the collection was made by the given key over the given message.
        bool verify (const secp256k1::pubkey &, const digest256 &message) const;
    };

    aggregate_signature aggregate (list<signature>);

    // a spend bundle: a set of spends that are committed together or not at all.
    struct transaction {
        list<spend> Spends;
        aggregate_signature Signature;

        transaction () : Spends {}, Signature {} {}
        transaction (list<spend> spends, aggregate_signature sig) : Spends {spends}, Signature {sig} {}

        // collect a list of signed spends into a transaction.
        explicit transaction (list<signed_spend>);

        digest256 id () const;

        explicit transaction (const JSON &);
        explicit operator JSON () const;
    };

    std::ostream &operator << (std::ostream &, const transaction &);

}

#endif
