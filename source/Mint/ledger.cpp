#include <Mint/ledger.hpp>

namespace Mint {

    coin_record::operator JSON () const {
        JSON::object_t j {
            {"coin", JSON (Coin)},
            {"coin_id", write (Coin.id ())},
            {"confirmed", Confirmed}};
        if (bool (Spent)) j["spent"] = *Spent;
        return j;
    }

    std::ostream &operator << (std::ostream &o, const coin_record &r) {
        return o << JSON (r).dump ();
    }

}
