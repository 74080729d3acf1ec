#ifndef MINT_LEDGER_MEMORY
#define MINT_LEDGER_MEMORY

#include <Mint/ledger.hpp>
#include <Mint/options.hpp>

#include <map>
#include <set>

namespace Mint {

    // An in-memory ledger for simulations and tests. Standard scripts are
    // understood directly. Any other script must be given a puzzle that
    // says what conditions it produces.
    struct memory_ledger final : ledger {

        // a puzzle that throws rejects the transaction.
        using puzzle = data::function<conditions (const coin &, const program &solution)>;

        memory_ledger (const session_options & = {});

        void define (const program &script, puzzle);

        submitted submit (const transaction &) final override;

        step advance (const digest256 &beneficiary) final override;

        list<coin> unspent (const digest256 &script_hash) const final override;

        maybe<coin_record> record (const digest256 &coin_id) const final override;

        list<coin_record> records (const digest256 &script_hash, bool include_spent = false) const final override;

        timestamp now () const final override {
            return Time;
        }

        uint64 height () const final override {
            return Height;
        }

        // the effect of a valid transaction.
        struct effect {
            list<coin> Additions;
            list<coin> Removals;
            amount Fee;
        };

        // throws rejected if the transaction is not valid.
        effect validate (const transaction &) const;

        struct rejected : data::exception {
            rejected (const std::string &reason) : data::exception {reason} {}
        };

        digest256 Genesis;
        uint32 BlockTime;
        amount PoolReward;
        amount FarmerReward;

        timestamp Time;
        uint64 Height;

        std::map<digest256, coin_record> Coins {};
        std::map<digest256, list<digest256>> ScriptIndex {};
        std::map<digest256, puzzle> Puzzles {};

        list<effect> Pending {};
        std::set<digest256> PendingRemovals {};

    private:
        conditions evaluate (const spend &) const;
        void insert (const coin &, uint64 height);
    };

}

#endif
