#include <Mint/ledger/memory.hpp>

namespace Mint {

    memory_ledger::memory_ledger (const session_options &o) :
        Genesis {o.Genesis}, BlockTime {o.BlockTime},
        PoolReward {o.PoolReward}, FarmerReward {o.FarmerReward},
        Time {o.StartTime}, Height {0} {}

    void memory_ledger::define (const program &script, puzzle p) {
        Puzzles[tree_hash (script)] = p;
    }

    conditions memory_ledger::evaluate (const spend &x) const {
        if (maybe<secp256k1::pubkey> k = read_standard_script (x.Script); bool (k))
            return read_standard_solution (x.Solution) << condition::require_signature (*k);

        auto p = Puzzles.find (x.Coin.ScriptHash);
        if (p == Puzzles.end ()) throw rejected {"unknown script " + write (x.Coin.ScriptHash)};

        try {
            return p->second (x.Coin, x.Solution);
        } catch (const std::exception &e) {
            throw rejected {std::string {"script failed: "} + e.what ()};
        }
    }

    memory_ledger::effect memory_ledger::validate (const transaction &t) const {
        if (t.Spends.size () == 0) throw rejected {"transaction has no spends"};

        effect fx {{}, {}, 0};

        amount spent {0};
        amount created {0};

        std::set<digest256> removed;
        std::set<digest256> added;
        std::set<digest256> announcements;
        list<digest256> assertions;
        list<std::pair<secp256k1::pubkey, digest256>> signatures;

        for (const spend &x : t.Spends) {
            digest256 coin_id = x.Coin.id ();

            if (removed.contains (coin_id)) throw rejected {"coin " + write (coin_id) + " is spent twice"};

            auto r = Coins.find (coin_id);
            if (r == Coins.end ()) throw rejected {"unknown coin " + write (coin_id)};
            if (r->second.spent ()) throw rejected {"double spend of coin " + write (coin_id)};
            if (PendingRemovals.contains (coin_id))
                throw rejected {"coin " + write (coin_id) + " is already spent by a pending transaction"};

            if (tree_hash (x.Script) != x.Coin.ScriptHash)
                throw rejected {"script does not match script hash of coin " + write (coin_id)};

            conditions cx;
            try {
                cx = evaluate (x);
            } catch (const rejected &) {
                throw;
            } catch (const std::exception &e) {
                throw rejected {std::string {"invalid solution: "} + e.what ()};
            }

            removed.insert (coin_id);
            fx.Removals <<= x.Coin;
            spent += x.Coin.Amount;

            for (const condition &c : cx) switch (c.Opcode) {
                case opcode::create_coin: {
                    coin n {coin_id, c.Digest, c.Amount};
                    digest256 n_id = n.id ();
                    if (added.contains (n_id) || Coins.contains (n_id))
                        throw rejected {"duplicate output " + write (n_id)};
                    if (created + c.Amount < created) throw rejected {"output value overflow"};
                    added.insert (n_id);
                    fx.Additions <<= n;
                    created += c.Amount;
                } break;
                case opcode::create_coin_announcement: {
                    announcements.insert (announcement_id (coin_id, c.Digest));
                } break;
                case opcode::assert_coin_announcement: {
                    assertions <<= c.Digest;
                } break;
                case opcode::require_signature: {
                    signatures <<= std::pair<secp256k1::pubkey, digest256> {c.Key, signature_message (x, Genesis)};
                } break;
                default: throw rejected {"unknown condition"};
            }
        }

        if (created > spent) throw rejected {"transaction creates more value than it spends"};

        for (const digest256 &a : assertions)
            if (!announcements.contains (a)) throw rejected {"assertion failed: announcement " + write (a) + " not found"};

        for (const auto &[k, message] : signatures)
            if (!t.Signature.verify (k, message)) throw rejected {"signature validation failed"};

        fx.Fee = spent - created;
        return fx;
    }

    submitted memory_ledger::submit (const transaction &t) {
        try {
            effect fx = validate (t);
            for (const coin &c : fx.Removals) PendingRemovals.insert (c.id ());
            Pending <<= fx;
            return {};
        } catch (const rejected &r) {
            return {std::string {r.what ()}};
        }
    }

    void memory_ledger::insert (const coin &c, uint64 height) {
        digest256 coin_id = c.id ();
        Coins.insert_or_assign (coin_id, coin_record {c, height, {}});
        ScriptIndex[c.ScriptHash] <<= coin_id;
    }

    step memory_ledger::advance (const digest256 &beneficiary) {
        uint64 h = ++Height;

        list<coin> additions;
        list<coin> removals;
        amount fees {0};

        for (const effect &fx : Pending) {
            for (const coin &c : fx.Removals) {
                Coins.at (c.id ()).Spent = h;
                removals <<= c;
            }

            for (const coin &c : fx.Additions) {
                insert (c, h);
                additions <<= c;
            }

            fees += fx.Fee;
        }

        Pending = {};
        PendingRemovals.clear ();

        coin pool {(preimage {} << std::string {"pool"} << Genesis << h).hash (), beneficiary, PoolReward};
        coin farmer {(preimage {} << std::string {"farmer"} << Genesis << h).hash (), beneficiary, FarmerReward + fees};

        for (const coin &reward : list<coin> {pool, farmer}) if (reward.Amount > 0) {
            insert (reward, h);
            additions <<= reward;
        }

        Time = timestamp {uint32 (Time) + BlockTime};

        return step {h, additions, removals};
    }

    list<coin> memory_ledger::unspent (const digest256 &script_hash) const {
        list<coin> coins;
        for (const coin_record &r : records (script_hash)) coins <<= r.Coin;
        return coins;
    }

    maybe<coin_record> memory_ledger::record (const digest256 &coin_id) const {
        auto r = Coins.find (coin_id);
        if (r == Coins.end ()) return {};
        return {r->second};
    }

    list<coin_record> memory_ledger::records (const digest256 &script_hash, bool include_spent) const {
        list<coin_record> rx;
        auto ids = ScriptIndex.find (script_hash);
        if (ids == ScriptIndex.end ()) return rx;
        for (const digest256 &coin_id : ids->second) {
            const coin_record &r = Coins.at (coin_id);
            if (include_spent || !r.spent ()) rx <<= r;
        }
        return rx;
    }

}
