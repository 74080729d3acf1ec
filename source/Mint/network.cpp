#include <Mint/network.hpp>
#include <Mint/duration.hpp>

#include <limits>

namespace Mint {

    network::network (const session_options &o) :
        network {std::make_shared<memory_ledger> (o), std::make_shared<deterministic_keys> (o.KeySeed), o} {}

    network::network (ptr<Mint::ledger> l, ptr<key_service> k, const session_options &o) :
        Options {o}, Ledger {l}, Keys {k}, Wallets {}, Nobody {nullptr} {
        if (Ledger == nullptr || Keys == nullptr) throw data::exception {} << "network requires a ledger and a key service";
        Nobody = &make_wallet ("nobody");
    }

    network::~network () {
        close ();
    }

    void network::close () {
        if (closed ()) return;
        if (Options.Verbose) std::cout << "closing session at height " << Ledger->height () << std::endl;
        Ledger = nullptr;
    }

    Mint::ledger &network::open () {
        if (closed ()) throw data::exception {} << "session is closed";
        return *Ledger;
    }

    const Mint::ledger &network::service () const {
        return const_cast<network *> (this)->open ();
    }

    wallet &network::make_wallet (const std::string &name) {
        open ();
        key_pair k = Keys->derive (uint32 (Wallets.size ()));
        ptr<wallet> w = std::make_shared<wallet> (*this, name, k);
        if (Wallets.contains (w->ScriptHash)) throw data::exception {} << "key for wallet " << name << " is already in use";
        Wallets[w->ScriptHash] = w;
        return *w;
    }

    bool network::knows (const wallet &w) const {
        auto x = Wallets.find (w.ScriptHash);
        return x != Wallets.end () && x->second.get () == &w;
    }

    timestamp network::now () const {
        return service ().now ();
    }

    void network::refresh () {
        Mint::ledger &l = open ();
        for (auto &[script_hash, w] : Wallets) {
            coin_set cs {};
            for (const coin &c : l.unspent (script_hash)) cs = cs.insert (redeemable {c, w->Script});
            w->set_coins (cs);
        }
    }

    step network::farm (const digest256 &beneficiary) {
        step s = open ().advance (beneficiary);
        refresh ();
        return s;
    }

    step network::farm_block () {
        return farm (Nobody->ScriptHash);
    }

    step network::farm_block (const wallet &farmer) {
        if (!knows (farmer)) throw invalid_recipient {};
        return farm (farmer.ScriptHash);
    }

    push_result network::push_tx (const transaction &t) {
        submitted s = open ().submit (t);
        if (!s) {
            if (Options.Verbose) std::cout << "transaction " << write (t.id ()) << " rejected: " << *s.Error << std::endl;
            return push_result {s};
        }

        return push_result {farm_block ()};
    }

    void network::skip_time (seconds d) {
        skip_time (d, *Nobody);
    }

    void network::skip_time (seconds d, const wallet &farmer) {
        if (d.count () < 0) throw data::exception {} << "cannot skip a negative duration";
        uint64 target = uint64 (uint32 (now ())) + uint64 (d.count ());
        if (target > std::numeric_limits<uint32>::max ())
            throw data::exception {} << "cannot skip " << write (d) << ": the clock would pass the end of its range";
        while (uint32 (now ()) < target) farm_block (farmer);
    }

    void network::skip_time (const std::string &duration) {
        skip_time (duration, *Nobody);
    }

    void network::skip_time (const std::string &duration, const wallet &farmer) {
        maybe<seconds> d = read_duration (duration);
        if (!bool (d)) throw data::exception {} << "could not read duration \"" << duration << "\"";
        skip_time (*d, farmer);
    }

}
