#ifndef MINT_WALLET
#define MINT_WALLET

#include <Mint/contract.hpp>
#include <Mint/select.hpp>
#include <Mint/result.hpp>

namespace Mint {

    struct network;
    struct wallet;

    // where value can be sent: another wallet in the same session or a contract.
    using recipient = either<const wallet *, contract>;

    // the selector cannot cover the requested amount.
    struct insufficient_funds : data::exception {
        amount Required;
        amount Available;

        insufficient_funds (amount required, amount available) :
            data::exception {"insufficient funds: " + std::to_string (available) + " < " + std::to_string (required)},
            Required {required}, Available {available} {}
    };

    // a recipient which is neither a wallet known to the session nor a contract.
    struct invalid_recipient : data::exception {
        invalid_recipient () : data::exception {"recipient is not a wallet in this session or a contract"} {}
    };

    struct spend_options {
        // value to send.
        amount Amount {1};

        // by default, a coin is sent back to the spending wallet.
        maybe<recipient> To {};

        // if provided, what is left of the coin after Amount is sent
        // goes here. Otherwise it goes to the farmer as a fee.
        maybe<recipient> Remainder {};

        // arguments given directly to the script of the coin. These replace
        // the value transfer described by the other options, so they cannot
        // be used with To or Remainder.
        maybe<program> Arguments {};
    };

    // A wallet tracks the coins locked to its own standard script. The coin set
    // is replaced by the network after every step and is never edited otherwise.
    struct wallet {
        network &Network;
        std::string Name;
        key_pair Keys;
        program Script;
        digest256 ScriptHash;
        coin_set Coins;

        wallet (network &, const std::string &name, const key_pair &);
        wallet (const wallet &) = delete;

        amount balance () const {
            return Coins.value ();
        }

        const secp256k1::pubkey &pubkey () const {
            return Keys.Pubkey;
        }

        // this wallet's script as the target of a contract launch.
        contract as_contract () const;

        // find a single coin containing at least the given amount,
        // combining coins if necessary. Throws insufficient_funds if the
        // wallet does not have enough. Nothing is returned if a combine
        // transaction is rejected.
        maybe<redeemable> choose_coin (amount);

        // merge coins into one coin in a single transaction.
        spend_result combine_coins (list<redeemable>);

        spend_result spend_coin (const redeemable &, const spend_options & = {});

        // send value to a contract. Returns the new contract coin or nothing if
        // the ledger rejects the transaction.
        maybe<redeemable> launch_contract (const contract &, amount = 1);

        maybe<redeemable> give (const wallet &to, amount);

        signed_spend standard_spend (const redeemable &, conditions) const;

        // the script hash of a recipient.
        digest256 resolve (const recipient &) const;

    private:
        friend struct network;
        void set_coins (coin_set);
    };

    std::ostream &operator << (std::ostream &, const wallet &);

    void inline wallet::set_coins (coin_set cs) {
        Coins = cs;
    }

}

#endif
