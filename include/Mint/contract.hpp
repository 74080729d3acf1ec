#ifndef MINT_CONTRACT
#define MINT_CONTRACT

#include <Mint/coin.hpp>

namespace Mint {

    // A locking script that is not a wallet. Contracts lock value
    // for purposes other than being a liquid, spendable balance.
    struct contract {
        digest256 Genesis;
        program Script;

        contract () : Genesis {}, Script {} {}
        contract (const digest256 &genesis, const program &script) : Genesis {genesis}, Script {script} {}

        digest256 script_hash () const {
            return tree_hash (Script);
        }

        // the coin this contract will own once the given parent creates it.
        redeemable custom_coin (const digest256 &parent, amount a) const {
            return redeemable {parent, Script, a};
        }

        bool operator == (const contract &c) const {
            return Genesis == c.Genesis && Script == c.Script;
        }
    };

    std::ostream inline &operator << (std::ostream &o, const contract &c) {
        return o << "contract {" << write (c.script_hash ()) << "}";
    }

}

#endif
