#include <Mint/address.hpp>

#include <cstring>
#include <vector>

namespace Mint::address {

    namespace {

        constexpr const char *Charset {"qpzry9x8gf2tvdw0s3jn54khce6mua7l"};

        constexpr uint32 Bech32mConstant {0x2bc830a3};

        uint32 polymod (const std::vector<byte> &values) {
            constexpr uint32 generator[] {0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};
            uint32 chk = 1;
            for (byte v : values) {
                byte top = chk >> 25;
                chk = ((chk & 0x1ffffff) << 5) ^ v;
                for (int i = 0; i < 5; i++) if ((top >> i) & 1) chk ^= generator[i];
            }
            return chk;
        }

        std::vector<byte> expand_prefix (const std::string &prefix) {
            std::vector<byte> x;
            for (char c : prefix) x.push_back (byte (c) >> 5);
            x.push_back (0);
            for (char c : prefix) x.push_back (byte (c) & 31);
            return x;
        }

        std::vector<byte> checksum (const std::string &prefix, const std::vector<byte> &values) {
            std::vector<byte> x = expand_prefix (prefix);
            x.insert (x.end (), values.begin (), values.end ());
            x.resize (x.size () + 6, 0);
            uint32 mod = polymod (x) ^ Bech32mConstant;
            std::vector<byte> sum (6);
            for (int i = 0; i < 6; i++) sum[i] = (mod >> (5 * (5 - i))) & 31;
            return sum;
        }

        // regroup bits from one word size to another.
        maybe<std::vector<byte>> convert_bits (const std::vector<byte> &in, int from, int to, bool pad) {
            uint32 acc = 0;
            int bits = 0;
            uint32 max = (1 << to) - 1;
            std::vector<byte> out;
            for (byte v : in) {
                if ((v >> from) != 0) return {};
                acc = (acc << from) | v;
                bits += from;
                while (bits >= to) {
                    bits -= to;
                    out.push_back ((acc >> bits) & max);
                }
            }

            if (pad) {
                if (bits > 0) out.push_back ((acc << (to - bits)) & max);
            } else if (bits >= from || ((acc << (to - bits)) & max) != 0) return {};

            return {out};
        }

    }

    maybe<digest256> read_hash (const std::string &x) {
        std::string hex = x.size () >= 2 && x.substr (0, 2) == "0x" ? x.substr (2) : x;
        if (hex.size () != 64) return {};

        maybe<bytes> b = encoding::hex::read (data::to_lower (hex));
        if (!bool (b) || b->size () != 32) return {};

        digest256 script_hash;
        std::copy (b->begin (), b->end (), script_hash.begin ());
        return {script_hash};
    }

    std::string write_hash (const digest256 &script_hash) {
        bytes b (32);
        std::copy (script_hash.begin (), script_hash.end (), b.begin ());
        return "0x" + data::to_lower (std::string (encoding::hex::write (b)));
    }

    std::string encode (const digest256 &script_hash, const std::string &prefix) {
        std::vector<byte> raw (script_hash.begin (), script_hash.end ());
        std::vector<byte> values = *convert_bits (raw, 8, 5, true);
        std::vector<byte> sum = checksum (prefix, values);

        std::string result = prefix + "1";
        for (byte v : values) result += Charset[v];
        for (byte v : sum) result += Charset[v];
        return result;
    }

    maybe<decoded> decode (const std::string &x) {
        if (x.size () < 8 || x.size () > 90) return {};

        bool lower = false;
        bool upper = false;
        for (char c : x) {
            if (c < 33 || c > 126) return {};
            if (c >= 'a' && c <= 'z') lower = true;
            if (c >= 'A' && c <= 'Z') upper = true;
        }

        if (lower && upper) return {};

        std::string str = data::to_lower (x);

        size_t separator = str.rfind ('1');
        if (separator == std::string::npos || separator == 0 || separator + 7 > str.size ()) return {};

        std::string prefix = str.substr (0, separator);

        std::vector<byte> values;
        for (size_t i = separator + 1; i < str.size (); i++) {
            const char *p = std::strchr (Charset, str[i]);
            if (p == nullptr) return {};
            values.push_back (byte (p - Charset));
        }

        std::vector<byte> check = expand_prefix (prefix);
        check.insert (check.end (), values.begin (), values.end ());
        if (polymod (check) != Bech32mConstant) return {};

        values.resize (values.size () - 6);
        maybe<std::vector<byte>> payload = convert_bits (values, 5, 8, false);
        if (!bool (payload) || payload->size () != 32) return {};

        digest256 script_hash;
        std::copy (payload->begin (), payload->end (), script_hash.begin ());
        return {decoded {prefix, script_hash}};
    }

}
