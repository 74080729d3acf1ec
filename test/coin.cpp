#include <Mint/contract.hpp>
#include <Mint/sign.hpp>
#include "gtest/gtest.h"

namespace Mint {

    digest256 test_digest (uint64 n) {
        return (preimage {} << n).hash ();
    }

    TEST (Coin, ID) {
        coin c {test_digest (1), test_digest (2), 100};

        EXPECT_EQ (c.id (), (coin {test_digest (1), test_digest (2), 100}.id ()));
        EXPECT_NE (c.id (), (coin {test_digest (3), test_digest (2), 100}.id ()));
        EXPECT_NE (c.id (), (coin {test_digest (1), test_digest (3), 100}.id ()));
        EXPECT_NE (c.id (), (coin {test_digest (1), test_digest (2), 101}.id ()));

        // the amount is written as 8 big endian bytes.
        EXPECT_EQ (c.id (), (preimage {} << test_digest (1) << test_digest (2) <<
            std::string {"\0\0\0\0\0\0\0\x64", 8}).hash ());
    }

    TEST (Coin, JSON) {
        coin c {test_digest (1), test_digest (2), 100};
        JSON j = JSON (c);

        EXPECT_EQ (j["amount"], 100);
        EXPECT_EQ (coin {j}, c);

        EXPECT_THROW (coin {JSON (5)}, data::exception);
        EXPECT_ANY_THROW (coin {JSON::parse (R"({"parent": "0x00", "script_hash": "0x00", "amount": 1})")});
    }

    TEST (Coin, Set) {
        program script = JSON::object_t {{"test", 1}};
        redeemable a {test_digest (1), script, 10};
        redeemable b {test_digest (2), script, 15};

        coin_set cs = coin_set {}.insert (a).insert (b);
        EXPECT_EQ (cs.size (), 2);
        EXPECT_EQ (cs.value (), 25);
        EXPECT_TRUE (cs.contains (a.id ()));

        EXPECT_EQ (total (list<redeemable> {a, b}), 25);
        EXPECT_EQ (total (list<redeemable> {}), 0);
    }

    TEST (Coin, Program) {
        program p = JSON::parse (R"({"a": [1, 2, 3]})");
        EXPECT_EQ (tree_hash (p), tree_hash (JSON::parse (R"({"a":[1,2,3]})")));
        EXPECT_NE (tree_hash (p), tree_hash (JSON::parse (R"({"a":[1,2]})")));

        redeemable r {test_digest (1), p, 3};
        EXPECT_EQ (r.ScriptHash, tree_hash (p));
    }

    TEST (Coin, Contract) {
        contract x {test_digest (9), JSON::object_t {{"vault", "x"}}};
        redeemable c = x.custom_coin (test_digest (4), 7);

        EXPECT_EQ (c.ScriptHash, x.script_hash ());
        EXPECT_EQ (c.Parent, test_digest (4));
        EXPECT_EQ (c.Amount, 7);
        EXPECT_EQ (c.Script, x.Script);
    }

    TEST (Coin, Conditions) {
        secp256k1::secret k {123};

        conditions cx {
            condition::create_coin (test_digest (1), 12),
            condition::create_coin_announcement (test_digest (2)),
            condition::assert_coin_announcement (test_digest (3)),
            condition::require_signature (k.to_public ())};

        JSON j = write (cx);
        EXPECT_EQ (j[0][0], 51);
        EXPECT_EQ (j[1][0], 60);
        EXPECT_EQ (j[2][0], 61);
        EXPECT_EQ (j[3][0], 50);

        conditions read = read_conditions (j);
        ASSERT_EQ (read.size (), 4);
        EXPECT_EQ (read.first ().Opcode, opcode::create_coin);
        EXPECT_EQ (read.first ().Digest, test_digest (1));
        EXPECT_EQ (read.first ().Amount, 12);
        EXPECT_EQ (write (read), j);

        EXPECT_THROW (read_conditions (JSON (1)), data::exception);
        EXPECT_THROW (read_conditions (JSON::parse ("[[99, \"0x00\"]]")), data::exception);
        EXPECT_THROW (read_conditions (JSON::parse ("[[51, 3]]")), data::exception);
    }

    TEST (Coin, StandardScript) {
        secp256k1::pubkey k = secp256k1::secret {123}.to_public ();
        program script = standard_script (k);

        maybe<secp256k1::pubkey> read = read_standard_script (script);
        ASSERT_TRUE (bool (read));
        EXPECT_EQ (*read, k);

        EXPECT_FALSE (bool (read_standard_script (JSON::object_t {{"vault", "x"}})));
        EXPECT_FALSE (bool (read_standard_script (JSON::object_t {{"standard", "zz"}})));

        conditions cx {condition::create_coin (tree_hash (script), 1)};
        EXPECT_EQ (write (read_standard_solution (standard_solution (cx))), write (cx));
        EXPECT_THROW (read_standard_solution (JSON (3)), data::exception);
    }

    TEST (Coin, Announcement) {
        EXPECT_EQ (announcement_id (test_digest (1), test_digest (2)), announcement_id (test_digest (1), test_digest (2)));
        EXPECT_NE (announcement_id (test_digest (1), test_digest (2)), announcement_id (test_digest (2), test_digest (1)));
    }

    TEST (Coin, Sign) {
        secp256k1::secret k {123};
        digest256 genesis = test_digest (100);
        redeemable c {test_digest (1), standard_script (k.to_public ()), 10};

        spend x {c, standard_solution ({condition::create_coin (c.ScriptHash, 10)})};
        signed_spend s = sign (x, k, genesis);

        aggregate_signature sigs = aggregate ({s.Signature});
        EXPECT_TRUE (sigs.verify (k.to_public (), signature_message (x, genesis)));
        EXPECT_FALSE (sigs.verify (k.to_public (), signature_message (x, test_digest (101))));
        EXPECT_FALSE (sigs.verify (secp256k1::secret {124}.to_public (), signature_message (x, genesis)));

        transaction t {list<signed_spend> {s}};
        EXPECT_EQ (t.Spends.size (), 1);
        EXPECT_EQ (t.Signature.size (), 1);

        transaction read {JSON (t)};
        EXPECT_EQ (read.id (), t.id ());
        EXPECT_TRUE (read.Signature.verify (k.to_public (), signature_message (read.Spends.first (), genesis)));
    }

}
