#ifndef MINT_DURATION
#define MINT_DURATION

#include <Mint/types.hpp>

namespace Mint {

    // read a duration such as "90", "1 day", "2h30m", "1.5 hours",
    // "1 week, 2 days" or a clock form such as "1:30" or "2:00:00".
    // A number with no unit is a number of seconds. Fractions of a
    // second are dropped.
    maybe<seconds> read_duration (const std::string &);

    std::string write (seconds);

}

#endif
