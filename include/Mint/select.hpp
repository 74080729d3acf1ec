#ifndef MINT_SELECT
#define MINT_SELECT

#include <Mint/coin.hpp>

#include <vector>

namespace Mint {

    struct selected {
        // sorted by descending amount.
        list<redeemable> Coins;
        amount Total;
    };

    // Search for a small set of coins whose total covers a target amount.
    // Coins are processed one at a time. After each coin, the smallest coins
    // are dropped for as long as the rest still cover the target.
    //
    // The result is not always the smallest possible set, but it is
    // deterministic given the order in which coins are processed.
    struct coin_search {
        amount Target;
        amount Total;

        // kept coins, largest first.
        std::vector<redeemable> Kept;

        coin_search (amount target) : Target {target}, Total {0}, Kept {} {}

        void process (const redeemable &);

        // nothing if the coins processed so far do not cover the target.
        maybe<selected> result () const;
    };

    // select coins to cover the target amount.
    maybe<selected> select_coins (amount target, const coin_set &);
    maybe<selected> select_coins (amount target, list<redeemable>);

}

#endif
