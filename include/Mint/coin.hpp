#ifndef MINT_COIN
#define MINT_COIN

#include <Mint/types.hpp>

namespace Mint {

    // a unit of value on the ledger. A coin is identified by the hash
    // of its three fields and can be spent exactly once.
    struct coin {
        digest256 Parent;
        digest256 ScriptHash;
        amount Amount;

        coin () : Parent {}, ScriptHash {}, Amount {0} {}
        coin (const digest256 &parent, const digest256 &script_hash, amount a) :
            Parent {parent}, ScriptHash {script_hash}, Amount {a} {}

        digest256 id () const;

        bool operator == (const coin &) const;

        explicit coin (const JSON &);
        explicit operator JSON () const;
    };

    std::ostream &operator << (std::ostream &, const coin &);

    // a coin together with the script that locks it, which
    // is what is needed in order to spend it.
    struct redeemable : coin {
        program Script;

        redeemable () : coin {}, Script {} {}
        redeemable (const coin &c, const program &script) : coin {c}, Script {script} {}
        redeemable (const digest256 &parent, const program &script, amount a) :
            coin {parent, tree_hash (script), a}, Script {script} {}
    };

    // the coins owned by a wallet, by coin id.
    struct coin_set : base_map<digest256, redeemable, coin_set> {
        using base_map<digest256, redeemable, coin_set>::base_map;

        amount value () const {
            amount v {0};
            for (const auto &[_, c] : *this) v += c.Amount;
            return v;
        }

        coin_set insert (const redeemable &c) const {
            return coin_set {base_map<digest256, redeemable, coin_set>::insert (c.id (), c)};
        }

        using base_map<digest256, redeemable, coin_set>::insert;
    };

    amount inline total (list<redeemable> coins) {
        amount v {0};
        for (const auto &c : coins) v += c.Amount;
        return v;
    }

    bool inline coin::operator == (const coin &c) const {
        return Parent == c.Parent && ScriptHash == c.ScriptHash && Amount == c.Amount;
    }

}

#endif
