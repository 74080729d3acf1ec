#include <Mint/wallet.hpp>
#include <Mint/network.hpp>

namespace Mint {

    wallet::wallet (network &n, const std::string &name, const key_pair &k) :
        Network {n}, Name {name}, Keys {k}, Script {standard_script (k.Pubkey)},
        ScriptHash {tree_hash (Script)}, Coins {} {}

    contract wallet::as_contract () const {
        return contract {Network.genesis (), Script};
    }

    digest256 wallet::resolve (const recipient &r) const {
        if (r.is<contract> ()) return r.get<contract> ().script_hash ();
        const wallet *w = r.get<const wallet *> ();
        if (w == nullptr || !Network.knows (*w)) throw invalid_recipient {};
        return w->ScriptHash;
    }

    signed_spend wallet::standard_spend (const redeemable &c, conditions cx) const {
        return sign (spend {c, standard_solution (cx)}, Keys.Secret, Network.genesis ());
    }

    // The ledger only knows how to spend coins independently. In order to
    // ensure that either all coins are spent or none are, the last coin
    // makes an announcement of the new coin and all others assert it.
    spend_result wallet::combine_coins (list<redeemable> coins) {
        if (coins.size () == 0) throw data::exception {} << "no coins to combine";

        // every push rewards the nobody wallet, so its balance cannot be checked after a combine.
        if (this == &Network.nobody ()) throw data::exception {} << "the wallet that receives block rewards cannot combine coins";

        amount beginning_balance = balance ();
        size_t beginning_coins = Coins.size ();

        redeemable last;
        for (const redeemable &c : coins) last = c;

        // the coin we will create.
        redeemable combined {last.id (), Script, total (coins)};

        digest256 expected = announcement_id (last.id (), combined.id ());

        list<signed_spend> spends;
        size_t index = 0;
        for (const redeemable &c : coins) if (index++ < coins.size () - 1)
            spends <<= standard_spend (c, conditions {condition::assert_coin_announcement (expected)});

        spends <<= standard_spend (last, conditions {
            condition::create_coin_announcement (combined.id ()),
            condition::create_coin (ScriptHash, combined.Amount)});

        if (Network.Options.Verbose)
            std::cout << Name << " is combining " << coins.size () << " coins into " << combined << std::endl;

        spend_result result {Network.push_tx (transaction {spends})};

        if (!result) return result;

        if (balance () != beginning_balance)
            throw data::exception {} << "balance of " << Name << " changed from " << beginning_balance << " to " << balance () << " after combine";

        if (Coins.size () + coins.size () - 1 != beginning_coins)
            throw data::exception {} << "expected " << Name << " to have " << (beginning_coins - (coins.size () - 1)) <<
                " coins after combine but found " << Coins.size ();

        return result;
    }

    maybe<redeemable> wallet::choose_coin (amount a) {
        if (a == 0) throw data::exception {} << "cannot choose a coin for zero";

        // every combine removes at least one coin.
        for (size_t rounds = Coins.size (); ; rounds--) {
            maybe<selected> s = select_coins (a, Coins);
            if (!bool (s)) throw insufficient_funds {a, balance ()};

            if (s->Coins.size () == 1) return {s->Coins.first ()};

            if (rounds == 0) throw data::exception {} << Name << " could not combine coins to get " << a;

            if (!combine_coins (s->Coins)) return {};
        }
    }

    spend_result wallet::spend_coin (const redeemable &c, const spend_options &o) {
        program solution;

        if (bool (o.Arguments)) {
            if (bool (o.To) || bool (o.Remainder))
                throw data::exception {} << "explicit arguments cannot be used with a recipient or a remainder";
            solution = *o.Arguments;
        } else {
            conditions cx {condition::create_coin (bool (o.To) ? resolve (*o.To) : ScriptHash, o.Amount)};

            if (bool (o.Remainder)) {
                digest256 remainder = resolve (*o.Remainder);
                if (o.Amount > c.Amount) throw insufficient_funds {o.Amount, c.Amount};
                if (c.Amount > o.Amount) cx <<= condition::create_coin (remainder, c.Amount - o.Amount);
            }

            solution = standard_solution (cx);
        }

        return spend_result {Network.push_tx (transaction {
            list<signed_spend> {sign (spend {c, solution}, Keys.Secret, Network.genesis ())}})};
    }

    maybe<redeemable> wallet::launch_contract (const contract &x, amount a) {
        maybe<redeemable> found = choose_coin (a);
        if (!bool (found)) return {};

        conditions cx {condition::create_coin (x.script_hash (), a)};
        if (a < found->Amount) cx <<= condition::create_coin (ScriptHash, found->Amount - a);

        push_result pushed = Network.push_tx (transaction {list<signed_spend> {standard_spend (*found, cx)}});
        if (!pushed) return {};

        return {x.custom_coin (found->id (), a)};
    }

    maybe<redeemable> wallet::give (const wallet &to, amount a) {
        if (!Network.knows (to)) throw invalid_recipient {};
        return launch_contract (to.as_contract (), a);
    }

    std::ostream &operator << (std::ostream &o, const wallet &w) {
        return o << "wallet {" << w.Name << ", script_hash: " << write (w.ScriptHash) << ", balance: " << w.balance () << "}";
    }

}
