#include <Mint/coin.hpp>

namespace Mint {

    digest256 coin::id () const {
        return (preimage {} << Parent << ScriptHash << uint64 (Amount)).hash ();
    }

    coin::coin (const JSON &j) : coin {} {
        if (!j.is_object ()) throw data::exception {} << "invalid coin format: " << j;
        Parent = read_digest (j.at ("parent"));
        ScriptHash = read_digest (j.at ("script_hash"));
        Amount = uint64 (j.at ("amount"));
    }

    coin::operator JSON () const {
        return JSON::object_t {
            {"parent", write (Parent)},
            {"script_hash", write (ScriptHash)},
            {"amount", Amount}};
    }

    std::ostream &operator << (std::ostream &o, const coin &c) {
        return o << "coin {" << write (c.id ()) << ", amount: " << c.Amount << "}";
    }

}
