#include <data/io/arg_parser.hpp>

#include <Mint/network.hpp>
#include <Mint/address.hpp>
#include <Mint/duration.hpp>
#include <Mint/error.hpp>

using namespace data;
using arg_parser = data::io::arg_parser;

Mint::error run (const arg_parser &);

enum class method {
    UNSET,
    HELP,     // print help messages
    VERSION,  // print a version message
    ENCODE,   // encode a script hash as an address
    DECODE,   // decode an address
    SIMULATE  // run a session against an in-memory ledger
};

int main (int arg_count, char **arg_values) {

    auto err = run (arg_parser {arg_count, arg_values});

    if (err.Message) std::cout << "Error: " << static_cast<std::string> (*err.Message) << std::endl;
    else if (err.Code) std::cout << "Error: unknown." << std::endl;

    return err.Code;
}

void version ();

void help (method meth = method::UNSET);

void command_encode (const arg_parser &);
void command_decode (const arg_parser &);
void command_simulate (const arg_parser &);

method read_method (const arg_parser &, uint32 index = 1);

Mint::error run (const arg_parser &p) {

    try {

        if (p.has ("version")) version ();

        else if (p.has ("help")) help ();

        else {

            method cmd = read_method (p);

            switch (cmd) {
                case method::VERSION: {
                    version ();
                    break;
                }

                case method::HELP: {
                    help (read_method (p, 2));
                    break;
                }

                case method::ENCODE: {
                    command_encode (p);
                    break;
                }

                case method::DECODE: {
                    command_decode (p);
                    break;
                }

                case method::SIMULATE: {
                    command_simulate (p);
                    break;
                }

                default: {
                    std::cout << "Error: could not read user's command." << std::endl;
                    help ();
                }
            }
        }

    } catch (const Mint::insufficient_funds &x) {
        std::cout << "Insufficient funds: required " << x.Required << " but only " << x.Available << " available." << std::endl;
        return Mint::error {1, std::string {x.what ()}};
    } catch (const data::exception &x) {
        return Mint::error {x.Code, std::string {x.what ()}};
    } catch (const std::exception &x) {
        return Mint::error {1, std::string {x.what ()}};
    }

    return {};
}

method read_method (const arg_parser &p, uint32 index) {
    maybe<std::string> m;
    p.get (index, m);
    if (!bool (m)) return method::UNSET;

    std::string x = data::to_lower (*m);

    if (x == "help") return method::HELP;
    if (x == "version") return method::VERSION;
    if (x == "encode") return method::ENCODE;
    if (x == "decode") return method::DECODE;
    if (x == "simulate") return method::SIMULATE;

    return method::UNSET;
}

void version () {
    std::cout << "Mint version 0.0.1 alpha" << std::endl;
}

void help (method meth) {
    switch (meth) {
        default : {
            version ();
            std::cout << "input should be <method> <args>... where method is "
                "\n\tencode     -- encode a script hash as an address."
                "\n\tdecode     -- decode an address to a script hash."
                "\n\tsimulate   -- run a session against an in-memory ledger."
                "\nuse help \"method\" for information on a specific method"<< std::endl;
        } break;
        case method::ENCODE : {
            std::cout << "Encode a 32 byte script hash in bech32m."
                "\narguments for method encode:"
                "\n\t(--hash=)<hex string>"
                "\n\t(--prefix=<string> (=" << Mint::address::DefaultPrefix << "))" << std::endl;
        } break;
        case method::DECODE : {
            std::cout << "Decode a bech32m address."
                "\narguments for method decode:"
                "\n\t(--address=)<bech32m string>" << std::endl;
        } break;
        case method::SIMULATE : {
            std::cout << "Run a session against an in-memory ledger. The first wallet farms some blocks, "
                "gives value to the others, which then combine their coins and launch a contract."
                "\narguments for method simulate:"
                "\n\t(--blocks=<uint32> (=2)) (blocks farmed to the first wallet)"
                "\n\t(--amount=<uint64> (=1000)) (value given to each other wallet in each of two payments)"
                "\n\t(--wallets=<uint32> (=3))"
                "\n\t(--skip=<duration>) (time to skip at the end, such as \"1 hour\")"
                "\n\t(--quiet) (only print the final balances)" << std::endl;
        } break;
    }
}

void command_encode (const arg_parser &p) {
    maybe<std::string> hash_string;
    p.get (2, "hash", hash_string);
    if (!bool (hash_string)) throw data::exception {"no hash provided"};

    maybe<Mint::digest256> hash = Mint::address::read_hash (*hash_string);
    if (!bool (hash)) throw data::exception {} << "could not read script hash " << *hash_string;

    maybe<std::string> prefix;
    p.get ("prefix", prefix);

    std::cout << Mint::address::encode (*hash, bool (prefix) ? *prefix : Mint::address::DefaultPrefix) << std::endl;
}

void command_decode (const arg_parser &p) {
    maybe<std::string> address_string;
    p.get (2, "address", address_string);
    if (!bool (address_string)) throw data::exception {"no address provided"};

    maybe<Mint::address::decoded> decoded = Mint::address::decode (*address_string);
    if (!bool (decoded)) throw data::exception {} << "could not decode address " << *address_string;

    std::cout << Mint::address::write_hash (decoded->ScriptHash) << std::endl;
}

void print_balances (Mint::network &n, const std::vector<Mint::wallet *> &wallets) {
    std::cout << "at " << uint32 (n.now ()) << " (height " << n.service ().height () << "):" << std::endl;
    for (const Mint::wallet *w : wallets)
        std::cout << "\t" << w->Name << ": " << w->balance () << " in " << w->Coins.size () << " coins" << std::endl;
}

void command_simulate (const arg_parser &p) {
    Mint::session_options options {};
    if (p.has ("quiet")) options.Verbose = false;

    maybe<uint32> blocks;
    p.get ("blocks", blocks);

    maybe<uint64> amount;
    p.get ("amount", amount);

    maybe<uint32> wallet_count;
    p.get ("wallets", wallet_count);

    maybe<std::string> skip;
    p.get ("skip", skip);

    uint32 block_count = bool (blocks) ? *blocks : 2;
    Mint::amount payment = bool (amount) ? *amount : 1000;
    uint32 count = bool (wallet_count) ? *wallet_count : 3;

    if (count < 2) throw data::exception {"simulation requires at least two wallets"};
    if (block_count == 0) throw data::exception {"simulation requires at least one block"};
    if (payment == 0) throw data::exception {"payment amount must be positive"};

    Mint::network n {options};

    std::vector<Mint::wallet *> wallets;
    for (uint32 i = 0; i < count; i++)
        wallets.push_back (&n.make_wallet (std::string {"wallet_"} + std::to_string (i)));

    Mint::wallet &farmer = *wallets[0];
    for (uint32 i = 0; i < block_count; i++) n.farm_block (farmer);

    if (options.Verbose) print_balances (n, wallets);

    // two payments each so that every other wallet has coins to combine.
    for (int round = 0; round < 2; round++) for (uint32 i = 1; i < count; i++)
        if (!bool (farmer.give (*wallets[i], payment)))
            throw data::exception {} << "payment to " << wallets[i]->Name << " was rejected";

    if (options.Verbose) print_balances (n, wallets);

    Mint::contract vault {n.genesis (), Mint::program (JSON::object_t {{"vault", "simulation"}})};

    for (uint32 i = 1; i < count; i++) {
        maybe<Mint::redeemable> c = wallets[i]->choose_coin (2 * payment);
        if (!bool (c)) throw data::exception {} << wallets[i]->Name << " could not combine its coins";
        if (!bool (wallets[i]->launch_contract (vault, payment)))
            throw data::exception {} << wallets[i]->Name << " could not launch a contract";
    }

    if (bool (skip)) n.skip_time (*skip);

    print_balances (n, wallets);

    Mint::amount locked {0};
    for (const Mint::coin_record &r : n.service ().records (vault.script_hash ())) locked += r.Coin.Amount;
    std::cout << "\tlocked in " << vault << ": " << locked << std::endl;
}
