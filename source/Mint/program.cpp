#include <Mint/program.hpp>

namespace Mint {

    digest256 tree_hash (const program &p) {
        return crypto::SHA2_256 (p.dump ());
    }

    std::string write (const digest256 &d) {
        std::stringstream ss;
        ss << d;
        return ss.str ();
    }

    digest256 read_digest (const JSON &j) {
        if (!j.is_string ()) throw data::exception {} << "invalid digest format: " << j;
        digest256 d {std::string (j)};
        if (!d.valid ()) throw data::exception {} << "could not read digest " << j;
        return d;
    }

    preimage &preimage::operator << (const digest256 &d) {
        Bytes.append (d.begin (), d.end ());
        return *this;
    }

    preimage &preimage::operator << (uint64 u) {
        for (int i = 7; i >= 0; i--) Bytes.push_back (static_cast<char> ((u >> (i * 8)) & 0xff));
        return *this;
    }

    preimage &preimage::operator << (const std::string &x) {
        Bytes += x;
        return *this;
    }

    digest256 preimage::hash () const {
        return crypto::SHA2_256 (Bytes);
    }

    std::ostream &operator << (std::ostream &o, opcode op) {
        switch (op) {
            case opcode::require_signature: return o << "require_signature";
            case opcode::create_coin: return o << "create_coin";
            case opcode::create_coin_announcement: return o << "create_coin_announcement";
            case opcode::assert_coin_announcement: return o << "assert_coin_announcement";
            default: return o << "opcode " << uint32 (op);
        }
    }

    condition condition::create_coin (const digest256 &script_hash, amount a) {
        return condition {opcode::create_coin, script_hash, a};
    }

    condition condition::create_coin_announcement (const digest256 &message) {
        return condition {opcode::create_coin_announcement, message};
    }

    condition condition::assert_coin_announcement (const digest256 &announcement_id) {
        return condition {opcode::assert_coin_announcement, announcement_id};
    }

    condition condition::require_signature (const secp256k1::pubkey &k) {
        return condition {opcode::require_signature, digest256 {}, 0, k};
    }

    condition::condition (const JSON &j) : condition {opcode::create_coin} {
        if (!j.is_array () || j.size () < 2 || !j[0].is_number_unsigned ())
            throw data::exception {} << "invalid condition format: " << j;

        Opcode = opcode (uint32 (j[0]));
        switch (Opcode) {
            case opcode::create_coin: {
                if (j.size () != 3 || !j[2].is_number_unsigned ())
                    throw data::exception {} << "invalid create_coin condition: " << j;
                Digest = read_digest (j[1]);
                Amount = uint64 (j[2]);
                return;
            }
            case opcode::create_coin_announcement:
            case opcode::assert_coin_announcement: {
                if (j.size () != 2) throw data::exception {} << "invalid " << Opcode << " condition: " << j;
                Digest = read_digest (j[1]);
                return;
            }
            case opcode::require_signature: {
                if (j.size () != 2 || !j[1].is_string ())
                    throw data::exception {} << "invalid require_signature condition: " << j;
                maybe<bytes> k = encoding::hex::read (std::string (j[1]));
                if (!bool (k)) throw data::exception {} << "could not read pubkey from " << j[1];
                Key = secp256k1::pubkey {*k};
                return;
            }
            default: throw data::exception {} << "unknown condition opcode " << j[0];
        }
    }

    condition::operator JSON () const {
        switch (Opcode) {
            case opcode::create_coin:
                return JSON::array_t {uint32 (Opcode), write (Digest), Amount};
            case opcode::require_signature:
                return JSON::array_t {uint32 (Opcode), encoding::hex::write (Key)};
            default:
                return JSON::array_t {uint32 (Opcode), write (Digest)};
        }
    }

    JSON write (conditions cx) {
        JSON::array_t a;
        for (const condition &c : cx) a.push_back (JSON (c));
        return a;
    }

    conditions read_conditions (const JSON &j) {
        if (!j.is_array ()) throw data::exception {} << "conditions must be a list: " << j;
        conditions cx;
        for (const JSON &c : j) cx <<= condition {c};
        return cx;
    }

    digest256 announcement_id (const digest256 &coin_id, const digest256 &message) {
        return (preimage {} << coin_id << message).hash ();
    }

    program standard_script (const secp256k1::pubkey &k) {
        return JSON::object_t {{"standard", encoding::hex::write (k)}};
    }

    maybe<secp256k1::pubkey> read_standard_script (const program &p) {
        if (!p.is_object () || p.size () != 1 || !p.contains ("standard") || !p["standard"].is_string ()) return {};
        maybe<bytes> k = encoding::hex::read (std::string (p["standard"]));
        if (!bool (k)) return {};
        secp256k1::pubkey pk {*k};
        if (!pk.valid ()) return {};
        return {pk};
    }

    program standard_solution (conditions cx) {
        return JSON::object_t {{"delegated", write (cx)}};
    }

    conditions read_standard_solution (const program &p) {
        if (!p.is_object () || !p.contains ("delegated"))
            throw data::exception {} << "invalid solution for standard script: " << p;
        return read_conditions (p["delegated"]);
    }

}
