/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <epochwise/common/test.hpp>
#include "types.hpp"

namespace {
    using namespace epochwise;
    using namespace epochwise::epoch;
}

suite epochwise_epoch_types_suite = [] {
    "epochwise::epoch::types"_test = [] {
        "account_id"_test = [] {
            for (const auto id: { "ab", "alice", "bob.near", "x-y_z.0", "1234" })
                expect(account_id_t::valid(id)) << id;
            for (const auto id: { "", "a", "Alice", "-bob", "bob-", "a..b", "a-_b", "al ice", "bob@near" })
                expect(!account_id_t::valid(id)) << id;
            expect(account_id_t::valid(std::string(64, 'a')));
            expect(!account_id_t::valid(std::string(65, 'a')));
            expect(throws([] { account_id_t { "Alice" }; }));
            expect_equal(std::string { "alice" }, account_id_t { "alice" }.str());
            expect(account_id_t { "alice" } < account_id_t { "bob" });
        };
        "balance decimal"_test = [] {
            static constexpr std::string_view max_str { "340282366920938463463374607431768211455" };
            expect_equal(std::string { max_str }, balance_t::from_string(max_str).str());
            expect_equal(balance_t { 1000 }, balance_t::from_string("1000"));
            expect_equal(std::string { "0" }, balance_t {}.str());
            expect(throws([] { balance_t::from_string("340282366920938463463374607431768211456"); }));
            expect(throws([] { balance_t::from_string(""); }));
            expect(throws([] { balance_t::from_string("12a"); }));
            expect(throws([] { balance_t::from_string("-1"); }));
            expect_equal(std::string { "1000" }, fmt::format("{}", balance_t { 1000 }));
        };
        "balance binary"_test = [] {
            const auto bytes = to_bytes(balance_t { 0x0102 });
            expect_equal(uint8_vector::from_hex("02010000000000000000000000000000"), bytes);
            const auto max = balance_t::from_string("340282366920938463463374607431768211455");
            expect_equal(uint8_vector::from_hex("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"), to_bytes(max));
            expect_equal(max, from_bytes<balance_t>(to_bytes(max)));
        };
        "balance json"_test = [] {
            const auto jv = codec::json::parse(std::string_view { R"("123456789012345678901234567890")" });
            const auto b = balance_t::from_json(jv);
            expect_equal(std::string { "123456789012345678901234567890" }, b.str());
            expect(b.to_json() == jv);
            expect(throws([] { balance_t::from_json(boost::json::value { 5 }); }));
        };
        "stats saturate"_test = [] {
            constexpr auto max = std::numeric_limits<uint64_t>::max();
            validator_stats_t s { max - 2, 10 };
            s += { 1, 1 };
            expect_equal(validator_stats_t { max - 1, 11 }, s);
            s += { 5, max };
            expect_equal(validator_stats_t { max, max }, s);
        };
        "proposal encoding"_test = [] {
            const validator_power_t p { account_id_t { "bob" }, public_key_t {}, 7 };
            const auto bytes = to_bytes(p);
            // varlen length, the account id, the key and a little-endian power
            expect_equal(size_t { 1 + 3 + 32 + 8 }, bytes.size());
            expect_equal(uint8_t { 3 }, bytes[0]);
            expect_equal(uint8_t { 7 }, bytes[36]);
            expect_equal(p, from_bytes<validator_power_t>(bytes));
            expect(throws([] { from_bytes<validator_power_t>(uint8_vector::from_hex("0141")); }));
        };
    };
};
