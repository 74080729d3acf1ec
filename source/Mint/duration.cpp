#include <Mint/duration.hpp>

#include <regex>

namespace Mint {

    namespace {

        maybe<uint64> unit_seconds (const std::string &unit) {
            if (unit == "" || unit == "s" || unit == "sec" || unit == "secs" || unit == "second" || unit == "seconds") return {1};
            if (unit == "m" || unit == "min" || unit == "mins" || unit == "minute" || unit == "minutes") return {60};
            if (unit == "h" || unit == "hr" || unit == "hrs" || unit == "hour" || unit == "hours") return {3600};
            if (unit == "d" || unit == "day" || unit == "days") return {86400};
            if (unit == "w" || unit == "wk" || unit == "week" || unit == "weeks") return {604800};
            return {};
        }

        // a number with up to nine decimal places, multiplied by a unit.
        // Fractions of a second are dropped.
        uint64 scale (const std::string &whole, const std::string &fraction, uint64 unit) {
            uint64 x = std::stoull (whole) * unit;
            if (fraction.size () == 0) return x;
            uint64 denominator {1};
            for (size_t i = 0; i < fraction.size (); i++) denominator *= 10;
            return x + std::stoull (fraction) * unit / denominator;
        }

        // [[h:]m:]s, as in 1:30 or 2:00:00.
        maybe<seconds> read_clock (const std::string &input) {
            static const std::regex clock {R"(\s*(?:(\d{1,9}):)?(\d{1,9}):(\d{2})(?:\.(\d{1,9}))?\s*)"};

            std::smatch m;
            if (!std::regex_match (input, m, clock)) return {};

            uint64 s = std::stoull (m[3].str ());
            if (s >= 60) return {};

            uint64 total = scale (m[3].str (), m[4].str (), 1);
            if (m[1].matched) {
                uint64 minutes = std::stoull (m[2].str ());
                if (minutes >= 60) return {};
                total += std::stoull (m[1].str ()) * 3600 + minutes * 60;
            } else total += std::stoull (m[2].str ()) * 60;

            return {seconds {static_cast<int64> (total)}};
        }

    }

    maybe<seconds> read_duration (const std::string &x) {
        static const std::regex term {R"(\s*(\d{1,9})(?:\.(\d{1,9}))?\s*([a-zA-Z]*)\s*,?)"};

        std::string input = data::to_lower (x);
        if (input.find_first_not_of (" \t") == std::string::npos) return {};

        if (input.find (':') != std::string::npos) return read_clock (input);

        uint64 total {0};
        auto begin = std::sregex_iterator (input.begin (), input.end (), term);
        size_t consumed = 0;

        for (auto i = begin; i != std::sregex_iterator {}; i++) {
            const std::smatch &m = *i;
            // terms must follow one another with nothing in between.
            if (size_t (m.position (0)) != consumed) return {};
            consumed += m.length (0);

            maybe<uint64> unit = unit_seconds (m[3].str ());
            if (!bool (unit)) return {};

            // a number with no unit is only allowed on its own.
            if (m[3].str () == "" && (i != begin || consumed != input.size ())) return {};

            total += scale (m[1].str (), m[2].str (), *unit);
        }

        if (consumed != input.size ()) return {};

        return {seconds {static_cast<int64> (total)}};
    }

    std::string write (seconds d) {
        int64 s = d.count ();
        if (s == 0) return "0s";

        std::stringstream ss;
        if (s < 0) {
            ss << "-";
            s = -s;
        }

        for (const auto &[size, unit] : std::initializer_list<std::pair<int64, const char *>> {
            {604800, "w"}, {86400, "d"}, {3600, "h"}, {60, "m"}, {1, "s"}}) if (s >= size) {
            ss << s / size << unit;
            s %= size;
        }

        return ss.str ();
    }

}
