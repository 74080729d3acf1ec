#include <Mint/select.hpp>
#include "gtest/gtest.h"

namespace Mint {

    list<redeemable> test_coins (list<amount> amounts) {
        program script = JSON::object_t {{"test", "select"}};
        list<redeemable> coins;
        uint64 n = 0;
        for (amount a : amounts) coins <<= redeemable {(preimage {} << n++).hash (), script, a};
        return coins;
    }

    list<amount> amounts (const selected &s) {
        list<amount> x;
        for (const redeemable &c : s.Coins) x <<= c.Amount;
        return x;
    }

    TEST (Select, AllCoinsNeeded) {
        maybe<selected> s = select_coins (25, test_coins ({10, 10, 10}));
        ASSERT_TRUE (bool (s));
        EXPECT_EQ (s->Coins.size (), 3);
        EXPECT_EQ (s->Total, 30);
    }

    TEST (Select, SingleCoin) {
        for (list<amount> x : list<list<amount>> {{5, 40}, {40, 5}, {40}}) {
            maybe<selected> s = select_coins (10, test_coins (x));
            ASSERT_TRUE (bool (s));
            EXPECT_EQ (amounts (*s), (list<amount> {40}));
            EXPECT_EQ (s->Total, 40);
        }

        maybe<selected> exact = select_coins (10, test_coins ({3, 10, 4}));
        ASSERT_TRUE (bool (exact));
        EXPECT_EQ (amounts (*exact), (list<amount> {10}));
    }

    TEST (Select, Infeasible) {
        EXPECT_FALSE (bool (select_coins (10, test_coins ({1, 2, 3}))));
        EXPECT_FALSE (bool (select_coins (1, test_coins ({}))));
        EXPECT_TRUE (bool (select_coins (6, test_coins ({1, 2, 3}))));
    }

    TEST (Select, DropSmallest) {
        // 3 is dropped once 7 and 5 are both kept.
        maybe<selected> s = select_coins (8, test_coins ({3, 7, 5}));
        ASSERT_TRUE (bool (s));
        EXPECT_EQ (amounts (*s), (list<amount> {7, 5}));
        EXPECT_EQ (s->Total, 12);

        // sorted largest first regardless of input order.
        maybe<selected> t = select_coins (20, test_coins ({1, 8, 2, 9, 6, 4}));
        ASSERT_TRUE (bool (t));
        EXPECT_EQ (amounts (*t), (list<amount> {9, 8, 6}));
        EXPECT_EQ (t->Total, 23);
    }

    TEST (Select, CannotDropAny) {
        // every kept coin is needed: removing the smallest would fall short.
        for (list<amount> x : list<list<amount>> {{1, 8, 2, 9, 6, 4}, {10, 10, 10}, {3, 7, 5}, {50, 1, 1, 1}})
            for (amount target : list<amount> {1, 5, 9, 12, 15, 20}) {
                maybe<selected> s = select_coins (target, test_coins (x));
                if (!bool (s)) continue;

                EXPECT_GE (s->Total, target);

                amount sum {0};
                amount smallest {0};
                for (const redeemable &c : s->Coins) {
                    sum += c.Amount;
                    smallest = c.Amount;
                }

                EXPECT_EQ (sum, s->Total);
                EXPECT_LT (s->Total - smallest, target);
            }
    }

    TEST (Select, EqualAmounts) {
        list<redeemable> coins = test_coins ({10, 10, 10});

        // the first of several equal coins is kept.
        maybe<selected> s = select_coins (10, coins);
        ASSERT_TRUE (bool (s));
        ASSERT_EQ (s->Coins.size (), 1);
        EXPECT_EQ (s->Coins.first ().id (), coins.first ().id ());

        // equal coins keep the order in which they arrived.
        maybe<selected> t = select_coins (20, coins);
        ASSERT_TRUE (bool (t));
        ASSERT_EQ (t->Coins.size (), 2);
        EXPECT_EQ (t->Coins.first ().id (), coins.first ().id ());
        EXPECT_EQ (t->Coins.rest ().first ().id (), coins.rest ().first ().id ());
    }

    TEST (Select, Streaming) {
        coin_search search {15};
        list<redeemable> coins = test_coins ({4, 6, 20});

        search.process (coins.first ());
        EXPECT_FALSE (bool (search.result ()));

        search.process (coins.rest ().first ());
        EXPECT_FALSE (bool (search.result ()));
        EXPECT_EQ (search.Total, 10);

        search.process (coins.rest ().rest ().first ());
        maybe<selected> s = search.result ();
        ASSERT_TRUE (bool (s));
        EXPECT_EQ (amounts (*s), (list<amount> {20}));
    }

    TEST (Select, CoinSet) {
        coin_set cs {};
        for (const redeemable &c : test_coins ({5, 40})) cs = cs.insert (c);

        maybe<selected> s = select_coins (10, cs);
        ASSERT_TRUE (bool (s));
        EXPECT_EQ (s->Total, 40);

        EXPECT_FALSE (bool (select_coins (46, cs)));
    }

}
