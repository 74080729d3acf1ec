#include <Mint/select.hpp>

namespace Mint {

    void coin_search::process (const redeemable &c) {
        // insert before the first coin that is strictly smaller,
        // so that equal amounts keep the order they arrived in.
        auto i = Kept.begin ();
        while (i != Kept.end () && i->Amount >= c.Amount) i++;
        Kept.insert (i, c);
        Total += c.Amount;

        while (Kept.size () > 0 && Total - Kept.back ().Amount >= Target) {
            Total -= Kept.back ().Amount;
            Kept.pop_back ();
        }
    }

    maybe<selected> coin_search::result () const {
        if (Total < Target) return {};
        list<redeemable> coins;
        for (const redeemable &c : Kept) coins <<= c;
        return {selected {coins, Total}};
    }

    maybe<selected> select_coins (amount target, const coin_set &cs) {
        coin_search search {target};
        for (const auto &[_, c] : cs) search.process (c);
        return search.result ();
    }

    maybe<selected> select_coins (amount target, list<redeemable> cs) {
        coin_search search {target};
        for (const redeemable &c : cs) search.process (c);
        return search.result ();
    }

}
