#ifndef MINT_ERROR
#define MINT_ERROR

#include <Mint/types.hpp>

namespace Mint {

    // returned to the command line.
    struct error {
        int Code;
        maybe<std::string> Message;
        error () : Code {0}, Message {} {}
        error (int code) : Code {code}, Message {} {}
        error (int code, const string &err): Code {code}, Message {err} {}
        error (const string &err): Code {1}, Message {err} {}
    };

}

#endif
