#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <compare>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>
#include <epochwise/codec/json.hpp>
#include <epochwise/common/bytes.hpp>
#include "encoding.hpp"

namespace epochwise::epoch {
    template<typename T, size_t MIN=0, size_t MAX=std::numeric_limits<size_t>::max()>
    struct sequence_t: std::vector<T> {
        static constexpr size_t min_size = MIN;
        static constexpr size_t max_size = MAX;
        static_assert(MIN <= MAX);
        using base_type = std::vector<T>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_array(*this, MIN, MAX);
        }
    };

    struct map_config_t {
        std::string key_name = "unknown";
        std::string val_name = "unknown";
    };

    template<typename K, typename V, typename CFG>
    struct map_t: std::map<K, V> {
        using base_type = std::map<K, V>;
        using base_type::base_type;

        static CFG config()
        {
            static CFG cfg;
            return cfg;
        }

        void serialize(auto &archive)
        {
            archive.process_map(*this, config().key_name, config().val_name);
        }
    };

    template<size_t SZ>
    struct byte_array_t: byte_array<SZ> {
        using base_type = byte_array<SZ>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_bytes_fixed(*this);
        }
    };

    struct bool_sequence_t: std::vector<bool> {
        using base_type = std::vector<bool>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_array(*this);
        }
    };

    using validator_id_t = uint64_t;
    using shard_id_t = uint64_t;
    using block_height_t = uint64_t;
    using protocol_version_t = uint32_t;
    using power_t = uint64_t;

    using crypto_hash_t = byte_array_t<32>;
    using epoch_id_t = crypto_hash_t;
    using public_key_t = byte_array_t<32>;

    using uint128_t = boost::multiprecision::uint128_t;

    // Unsigned 128-bit token amount: 16 little-endian bytes on the wire and a decimal string in JSON
    struct balance_t {
        uint128_t value {};

        static balance_t from_string(std::string_view s);
        static balance_t from_bytes(decoder &dec);
        static balance_t from_json(const boost::json::value &jv);

        balance_t() = default;

        balance_t(const uint64_t v):
            value { v }
        {
        }

        explicit balance_t(const uint128_t &v):
            value { v }
        {
        }

        void to_bytes(encoder &enc) const;
        [[nodiscard]] boost::json::value to_json() const;
        [[nodiscard]] std::string str() const;

        bool operator==(const balance_t &o) const
        {
            return value == o.value;
        }

        bool operator<(const balance_t &o) const
        {
            return value < o.value;
        }
    };

    // Human-readable account name: 2 to 64 characters of [a-z0-9] separated by single '.', '-' or '_'
    struct account_id_t {
        static constexpr size_t min_size = 2;
        static constexpr size_t max_size = 64;

        static bool valid(std::string_view id);
        static account_id_t from_bytes(decoder &dec);
        static account_id_t from_json(const boost::json::value &jv);

        account_id_t() = default;
        account_id_t(std::string_view id);

        account_id_t(const char *id):
            account_id_t { std::string_view { id } }
        {
        }

        void to_bytes(encoder &enc) const;
        [[nodiscard]] boost::json::value to_json() const;

        [[nodiscard]] const std::string &str() const noexcept
        {
            return _id;
        }

        std::strong_ordering operator<=>(const account_id_t &o) const noexcept
        {
            return _id.compare(o._id) <=> 0;
        }

        bool operator==(const account_id_t &o) const noexcept
        {
            return _id == o._id;
        }
    private:
        std::string _id {};
    };

    struct validator_stats_t {
        uint64_t produced = 0;
        uint64_t expected = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("produced"sv, produced);
            archive.process("expected"sv, expected);
        }

        // saturating: a counter that would overflow stays at the maximum
        validator_stats_t &operator+=(const validator_stats_t &o) noexcept
        {
            produced = _add_sat(produced, o.produced);
            expected = _add_sat(expected, o.expected);
            return *this;
        }

        bool operator==(const validator_stats_t &o) const = default;
    private:
        static uint64_t _add_sat(const uint64_t a, const uint64_t b) noexcept
        {
            const uint64_t res = a + b;
            if (res < a) [[unlikely]]
                return std::numeric_limits<uint64_t>::max();
            return res;
        }
    };

    struct validator_power_t {
        account_id_t account_id {};
        public_key_t public_key {};
        power_t power = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("account_id"sv, account_id);
            archive.process("public_key"sv, public_key);
            archive.process("power"sv, power);
        }

        bool operator==(const validator_power_t &o) const = default;
    };

    struct validator_pledge_t {
        account_id_t account_id {};
        public_key_t public_key {};
        balance_t pledge {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("account_id"sv, account_id);
            archive.process("public_key"sv, public_key);
            archive.process("pledge"sv, pledge);
        }

        bool operator==(const validator_pledge_t &o) const = default;
    };

    struct slashed_validator_t {
        account_id_t account_id {};
        bool is_double_sign = false;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("account_id"sv, account_id);
            archive.process("is_double_sign"sv, is_double_sign);
        }

        bool operator==(const slashed_validator_t &o) const = default;
    };

    using power_proposal_list_t = sequence_t<validator_power_t>;
    using pledge_proposal_list_t = sequence_t<validator_pledge_t>;
    using slashed_validator_list_t = sequence_t<slashed_validator_t>;
}

namespace fmt {
    template<size_t SZ>
    struct formatter<epochwise::epoch::byte_array_t<SZ>>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<epochwise::epoch::balance_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.str());
        }
    };

    template<>
    struct formatter<epochwise::epoch::account_id_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(v.str(), ctx);
        }
    };
}
