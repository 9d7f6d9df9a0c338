#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <concepts>
#include <iterator>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <typeinfo>
#include <boost/json.hpp>
#include <epochwise/common/bytes.hpp>
#include "serializable.hpp"

namespace epochwise::codec::json {
    using namespace boost::json;

    template<typename T>
    concept from_json_c = requires(const boost::json::value &jv)
    {
        { T::from_json(jv) } -> std::same_as<T>;
    };

    template<typename T>
    concept to_json_c = requires(const T t)
    {
        { t.to_json() } -> std::convertible_to<boost::json::value>;
    };

    extern value parse(buffer text);
    extern value load(const std::string &path);
    // two-space indented output with one member or element per line
    extern std::string serialize_pretty(const value &jv);
    extern void save_pretty(const std::string &path, const value &jv);

    // Fields are object members, sequences are arrays, maps are arrays of { key_name, val_name } objects,
    // fixed-size byte strings are 0x-prefixed hex, and integers are JSON numbers.
    struct decoder: archive_t {
        template<typename T>
        static void decode(const value &jv, T &val)
        {
            if constexpr (from_json_c<T>) {
                val = T::from_json(jv);
            } else if constexpr (serializable_c<T>) {
                decoder dec { jv };
                val.serialize(dec);
            } else if constexpr (std::is_same_v<T, bool>) {
                val = jv.as_bool();
            } else if constexpr (std::unsigned_integral<T>) {
                val = value_to<T>(jv);
            } else {
                throw error(fmt::format("no JSON form is defined for {}", typeid(T).name()));
            }
        }

        explicit decoder(const value &jv):
            _jv { jv }
        {
        }

        template<typename T>
        void process(const std::string_view name, T &val)
        {
            const auto *field = _jv.as_object().if_contains(name);
            if (!field) [[unlikely]]
                throw error(fmt::format("a required field '{}' is missing in {}", name, boost::json::serialize(_jv)));
            decode(*field, val);
        }

        template<typename M>
        void process_map(M &m, const std::string_view key_name, const std::string_view val_name)
        {
            m.clear();
            for (const auto &item: _jv.as_array()) {
                decoder item_dec { item };
                typename M::key_type k {};
                item_dec.process(key_name, k);
                typename M::mapped_type v {};
                item_dec.process(val_name, v);
                if (!m.try_emplace(std::move(k), std::move(v)).second) [[unlikely]]
                    throw error(fmt::format("a repeated {} in {}", key_name, boost::json::serialize(item)));
            }
        }

        template<typename S>
        void process_array(S &seq, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            const auto &items = _jv.as_array();
            if (items.size() < min_sz || items.size() > max_sz) [[unlikely]]
                throw error(fmt::format("an array of {} items is outside of the allowed range [{}, {}]", items.size(), min_sz, max_sz));
            seq.clear();
            seq.reserve(items.size());
            for (const auto &item: items) {
                typename S::value_type v {};
                decode(item, v);
                seq.emplace_back(std::move(v));
            }
        }

        void process_bytes_fixed(const std::span<uint8_t> out)
        {
            const auto hex = value_to<std::string_view>(_jv);
            if (!hex.starts_with("0x")) [[unlikely]]
                throw error(fmt::format("expected a 0x-prefixed hex string but got: {}", hex));
            decode_hex(out, hex.substr(2));
        }
    private:
        const value &_jv;
    };

    // Produces the layout that decoder accepts
    struct encoder: archive_t {
        template<typename T>
        static value encode(const T &val)
        {
            if constexpr (to_json_c<T>) {
                return val.to_json();
            } else if constexpr (serializable_c<T>) {
                encoder enc {};
                // archives only read the fields they are given
                const_cast<T &>(val).serialize(enc);
                return std::move(enc._val);
            } else if constexpr (std::is_same_v<T, bool>) {
                return value(val);
            } else if constexpr (std::unsigned_integral<T>) {
                return value(static_cast<uint64_t>(val));
            } else {
                throw error(fmt::format("no JSON form is defined for {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view name, const T &val)
        {
            if (!_val.is_object())
                _val.emplace_object();
            _val.as_object().emplace(name, encode(val));
        }

        template<typename M>
        void process_map(const M &m, const std::string_view key_name, const std::string_view val_name)
        {
            array items {};
            items.reserve(m.size());
            for (const auto &[k, v]: m) {
                object item {};
                item.emplace(key_name, encode(k));
                item.emplace(val_name, encode(v));
                items.emplace_back(std::move(item));
            }
            _val = std::move(items);
        }

        template<typename S>
        void process_array(const S &seq, const size_t=0, const size_t=std::numeric_limits<size_t>::max())
        {
            array items {};
            items.reserve(seq.size());
            for (const auto &v: seq)
                items.emplace_back(encode(v));
            _val = std::move(items);
        }

        void process_bytes_fixed(const buffer bytes)
        {
            std::string hex { "0x" };
            hex.reserve(hex.size() + bytes.size() * 2);
            for (const auto b: bytes)
                fmt::format_to(std::back_inserter(hex), "{:02x}", b);
            _val = boost::json::string { std::string_view { hex } };
        }
    private:
        value _val {};
    };

    template<typename T>
    value to_value(const T &val)
    {
        return encoder::encode(val);
    }

    template<typename T>
    T from_value(const value &jv)
    {
        T res {};
        decoder::decode(jv, res);
        return res;
    }

    template<typename T>
    T load_obj(const std::string &path)
    {
        return from_value<T>(load(path));
    }
}

namespace fmt {
    // serializable types are printed as compact JSON
    template<epochwise::codec::serializable_c T>
    struct formatter<T>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            const auto text = boost::json::serialize(epochwise::codec::json::to_value(v));
            return formatter<std::string_view>::format(text, ctx);
        }
    };
}
