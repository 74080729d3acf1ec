#ifndef MINT_LEDGER
#define MINT_LEDGER

#include <Mint/sign.hpp>

namespace Mint {

    // what the ledger says when given a transaction.
    struct submitted {
        // the reason a transaction was rejected.
        maybe<std::string> Error;

        submitted () : Error {} {}
        submitted (const std::string &err) : Error {err} {}

        // submitted is equivalent to true when the transaction was accepted.
        operator bool () const {
            return !bool (Error);
        }

        bool error () const {
            return bool (Error);
        }
    };

    // the coins created and destroyed in one step of the ledger.
    struct step {
        uint64 Height;
        list<coin> Additions;
        list<coin> Removals;

        step () : Height {0}, Additions {}, Removals {} {}
        step (uint64 height, list<coin> add, list<coin> rem) : Height {height}, Additions {add}, Removals {rem} {}
    };

    struct coin_record {
        coin Coin;
        // height of the step that created this coin.
        uint64 Confirmed;
        // height of the step that spent it, if it has been spent.
        maybe<uint64> Spent;

        bool spent () const {
            return bool (Spent);
        }

        explicit operator JSON () const;
    };

    std::ostream &operator << (std::ostream &, const coin_record &);

    // The service that validates and commits transactions. The core
    // does not know how the ledger evaluates scripts.
    struct ledger {

        // validate a transaction and hold it to be committed in the next step.
        virtual submitted submit (const transaction &) = 0;

        // commit all held transactions and produce a step crediting the beneficiary.
        virtual step advance (const digest256 &beneficiary) = 0;

        // unspent coins locked by the given script hash.
        virtual list<coin> unspent (const digest256 &script_hash) const = 0;

        virtual maybe<coin_record> record (const digest256 &coin_id) const = 0;

        virtual list<coin_record> records (const digest256 &script_hash, bool include_spent = false) const = 0;

        virtual timestamp now () const = 0;

        virtual uint64 height () const = 0;

        virtual ~ledger () {}
    };

}

#endif
