#include <Mint/sign.hpp>

namespace Mint {

    spend::spend (const JSON &j) : Coin {j.at ("coin")}, Script {j.at ("script")}, Solution {j.at ("solution")} {}

    spend::operator JSON () const {
        return JSON::object_t {
            {"coin", JSON (Coin)},
            {"script", Script},
            {"solution", Solution}};
    }

    digest256 signature_message (const program &solution, const digest256 &coin_id, const digest256 &genesis) {
        return (preimage {} << tree_hash (solution) << coin_id << genesis).hash ();
    }

    signed_spend sign (const spend &x, const secp256k1::secret &k, const digest256 &genesis) {
        return signed_spend {x, k.sign (signature_message (x, genesis))};
    }

    bool aggregate_signature::verify (const secp256k1::pubkey &k, const digest256 &message) const {
        for (const signature &sig : *this) if (k.verify (message, sig)) return true;
        return false;
    }

    aggregate_signature aggregate (list<signature> sigs) {
        return aggregate_signature {sigs};
    }

    transaction::transaction (list<signed_spend> x) : Spends {}, Signature {} {
        list<signature> sigs;
        for (const signed_spend &s : x) {
            Spends <<= s.Spend;
            sigs <<= s.Signature;
        }
        Signature = aggregate (sigs);
    }

    digest256 transaction::id () const {
        preimage p {};
        for (const spend &x : Spends) p << x.Coin.id () << tree_hash (x.Solution);
        return p.hash ();
    }

    transaction::transaction (const JSON &j) : Spends {}, Signature {} {
        if (!j.is_object () || !j.contains ("spends") || !j.contains ("signature"))
            throw data::exception {} << "invalid transaction format";

        for (const JSON &x : j["spends"]) Spends <<= spend {x};

        list<signature> sigs;
        for (const JSON &x : j["signature"]) {
            maybe<bytes> b = encoding::hex::read (std::string (x));
            if (!bool (b)) throw data::exception {} << "could not read signature " << x;
            sigs <<= signature {*b};
        }

        Signature = aggregate (sigs);
    }

    transaction::operator JSON () const {
        JSON::array_t spends;
        for (const spend &x : Spends) spends.push_back (JSON (x));

        JSON::array_t sigs;
        for (const signature &x : Signature) sigs.push_back (encoding::hex::write (x));

        return JSON::object_t {
            {"spends", spends},
            {"signature", sigs}};
    }

    std::ostream &operator << (std::ostream &o, const transaction &t) {
        return o << "transaction {" << write (t.id ()) << ", spends: " << t.Spends.size () << "}";
    }

}
