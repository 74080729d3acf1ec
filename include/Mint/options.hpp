#ifndef MINT_OPTIONS
#define MINT_OPTIONS

#include <Mint/types.hpp>

namespace Mint {

    struct session_options {
        // the simulated clock starts after the initial transaction freeze.
        constexpr static uint32 DefaultStartTime {1620061201};
        constexpr static uint32 DefaultBlockTime {20};

        constexpr static amount DefaultPoolReward {1750000000000};
        constexpr static amount DefaultFarmerReward {250000000000};

        constexpr static uint64 DefaultKeySeed {0x1bad5eed};

        constexpr static const char *DefaultGenesis {
            "0xccd5bb71183532bff220ba46c268991a3ff07eb358e8255a65c30a2dce0e5fbb"};

        static digest256 default_genesis () {
            static digest256 g {std::string {DefaultGenesis}};
            return g;
        }

        timestamp StartTime {DefaultStartTime};

        // seconds between steps.
        uint32 BlockTime {DefaultBlockTime};

        amount PoolReward {DefaultPoolReward};
        amount FarmerReward {DefaultFarmerReward};

        // the domain parameter that every signature commits to.
        digest256 Genesis {default_genesis ()};

        uint64 KeySeed {DefaultKeySeed};

        // print what happens to std::cout.
        bool Verbose {true};
    };

}

#endif
