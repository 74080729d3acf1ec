#ifndef MINT_NETWORK
#define MINT_NETWORK

#include <Mint/wallet.hpp>
#include <Mint/options.hpp>
#include <Mint/ledger/memory.hpp>

#include <map>

namespace Mint {

    // A session with a ledger. The network owns every wallet and is the
    // only thing that talks to the ledger. Transactions are pushed one at a
    // time and each one is committed in its own step.
    struct network {
        session_options Options;

        // a session with a fresh in-memory ledger.
        network (const session_options & = {});
        network (ptr<Mint::ledger>, ptr<key_service>, const session_options & = {});

        network (const network &) = delete;
        network &operator = (const network &) = delete;

        ~network ();

        // release the ledger. Any further use of the session throws.
        void close ();

        bool closed () const {
            return Ledger == nullptr;
        }

        // create a wallet whose coins will be tracked by the session.
        wallet &make_wallet (const std::string &name);

        // the wallet that receives block rewards when nobody else is named.
        wallet &nobody () {
            return *Nobody;
        }

        bool knows (const wallet &) const;

        const Mint::ledger &service () const;

        // submit a transaction. If it is valid, farm a block containing it.
        push_result push_tx (const transaction &);

        // farm a block and update every wallet from the ledger.
        step farm_block ();
        step farm_block (const wallet &farmer);

        // farm blocks until the given duration has passed.
        void skip_time (seconds);
        void skip_time (seconds, const wallet &farmer);

        // durations like "1 day" or "2h30m".
        void skip_time (const std::string &duration);
        void skip_time (const std::string &duration, const wallet &farmer);

        timestamp now () const;

        const digest256 &genesis () const {
            return Options.Genesis;
        }

    private:
        ptr<Mint::ledger> Ledger;
        ptr<key_service> Keys;

        // by script hash.
        std::map<digest256, ptr<wallet>> Wallets;
        wallet *Nobody;

        Mint::ledger &open ();
        step farm (const digest256 &beneficiary);
        void refresh ();
    };

}

#endif
