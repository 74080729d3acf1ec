#ifndef MINT_RESULT
#define MINT_RESULT

#include <Mint/ledger.hpp>

namespace Mint {

    // the result of pushing a transaction to the network. If the transaction
    // was accepted, the step that committed it is included.
    struct push_result : submitted {
        uint64 Height;
        list<coin> Additions;
        list<coin> Removals;

        push_result (const submitted &s) : submitted {s}, Height {0}, Additions {}, Removals {} {}
        push_result (const step &s) : submitted {}, Height {s.Height}, Additions {s.Additions}, Removals {s.Removals} {}
    };

    // what a wallet operation tells its caller about the transaction it pushed.
    struct spend_result {
        // a description of the error, if the ledger rejected the transaction.
        maybe<std::string> Error;

        // new coins created in the step that committed the transaction.
        list<coin> Outputs;

        explicit spend_result (const push_result &r) : Error {r.Error}, Outputs {} {
            if (bool (r)) Outputs = r.Additions;
        }

        operator bool () const {
            return !bool (Error);
        }

        // find the outputs which belong to the given wallet script.
        list<coin> find_standard_coins (const digest256 &script_hash) const {
            list<coin> found;
            for (const coin &c : Outputs) if (c.ScriptHash == script_hash) found <<= c;
            return found;
        }
    };

}

#endif
