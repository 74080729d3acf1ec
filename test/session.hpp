#ifndef MINT_TEST_SESSION
#define MINT_TEST_SESSION

#include <Mint/network.hpp>
#include "gtest/gtest.h"

namespace Mint::test {

    session_options inline quiet () {
        session_options o {};
        o.Verbose = false;
        return o;
    }

    recipient inline to (const wallet &w) {
        return recipient {&w};
    }

    amount inline total_of (list<amount> amounts) {
        amount v {0};
        for (amount a : amounts) v += a;
        return v;
    }

    redeemable inline first_coin (const wallet &w) {
        for (const auto &[_, c] : w.Coins) return c;
        throw data::exception {} << w.Name << " has no coins";
    }

    // give the wallet one new coin for each amount, paid for
    // by a bank wallet which farms a block to itself.
    void inline fund (network &n, wallet &bank, wallet &w, list<amount> amounts) {
        if (bank.balance () < total_of (amounts)) n.farm_block (bank);
        for (amount a : amounts) ASSERT_TRUE (bool (bank.give (w, a)));
    }

}

#endif
