/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "types.hpp"

namespace epochwise::epoch {
    balance_t balance_t::from_string(const std::string_view s)
    {
        if (s.empty()) [[unlikely]]
            throw error("a balance must not be an empty string");
        static const uint128_t max_val = std::numeric_limits<uint128_t>::max();
        uint128_t val = 0;
        for (const char k: s) {
            if (k < '0' || k > '9') [[unlikely]]
                throw error(fmt::format("a balance must be a decimal number but got: '{}'", s));
            const auto digit = static_cast<unsigned>(k - '0');
            if (val > (max_val - digit) / 10) [[unlikely]]
                throw error(fmt::format("a balance does not fit into 128 bits: {}", s));
            val = val * 10 + digit;
        }
        return balance_t { val };
    }

    balance_t balance_t::from_bytes(decoder &dec)
    {
        const auto bytes = dec.next_bytes(16);
        uint128_t val = 0;
        for (size_t i = 16; i > 0; --i) {
            val <<= 8;
            val |= bytes[i - 1];
        }
        return balance_t { val };
    }

    balance_t balance_t::from_json(const boost::json::value &jv)
    {
        return from_string(jv.as_string());
    }

    void balance_t::to_bytes(encoder &enc) const
    {
        byte_array<16> bytes;
        auto x = value;
        for (auto &b: bytes) {
            b = static_cast<uint8_t>(x & 0xFF);
            x >>= 8;
        }
        enc.process_bytes_fixed(bytes);
    }

    boost::json::value balance_t::to_json() const
    {
        return boost::json::string { str() };
    }

    std::string balance_t::str() const
    {
        return value.str();
    }

    bool account_id_t::valid(const std::string_view id)
    {
        if (id.size() < min_size || id.size() > max_size)
            return false;
        bool last_sep = true;
        for (const char k: id) {
            if ((k >= 'a' && k <= 'z') || (k >= '0' && k <= '9')) {
                last_sep = false;
            } else if (k == '-' || k == '_' || k == '.') {
                // a separator can't start the id or follow another separator
                if (last_sep)
                    return false;
                last_sep = true;
            } else {
                return false;
            }
        }
        return !last_sep;
    }

    account_id_t::account_id_t(const std::string_view id):
        _id { id }
    {
        if (!valid(_id)) [[unlikely]]
            throw error(fmt::format("an invalid account id: '{}'", id));
    }

    account_id_t account_id_t::from_bytes(decoder &dec)
    {
        const auto sz = dec.uint_varlen<size_t>();
        return { static_cast<std::string_view>(dec.next_bytes(sz)) };
    }

    account_id_t account_id_t::from_json(const boost::json::value &jv)
    {
        return { std::string_view { jv.as_string() } };
    }

    void account_id_t::to_bytes(encoder &enc) const
    {
        enc.uint_varlen(_id.size());
        enc.process_bytes_fixed(buffer { _id });
    }

    boost::json::value account_id_t::to_json() const
    {
        return boost::json::string { _id };
    }
}
