/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <epochwise/common/test.hpp>
#include "aggregator.hpp"

namespace {
    using namespace epochwise;
    using namespace epochwise::epoch;
}

suite epochwise_epoch_encoding_suite = [] {
    "epochwise::epoch::encoding"_test = [] {
        "uint_varlen"_test = [] {
            using test_vector = std::pair<uint64_t, std::string_view>;
            static std::vector test_vectors = {
                test_vector { 0, "00" },
                test_vector { 127, "7F" },
                test_vector { 128, "8080" },
                test_vector { 1023, "83FF" },
                test_vector { 16384, "C00040" },
                test_vector { uint64_t { 1 } << 56, "FF0000000000000001" }
            };
            for (const auto &[val, hex]: test_vectors) {
                const auto exp = uint8_vector::from_hex(hex);
                encoder enc {};
                enc.uint_varlen(val);
                expect_equal(exp, enc.bytes(), fmt::format("encode {}", val));
                decoder dec { exp };
                expect_equal(val, dec.uint_varlen(), fmt::format("decode {}", val));
                expect(dec.empty());
            }
        };
        "uint_fixed"_test = [] {
            encoder enc {};
            enc.process(uint32_t { 0x01020304 });
            enc.process(uint16_t { 0xABCD });
            enc.process(true);
            expect_equal(uint8_vector::from_hex("04030201CDAB01"), enc.bytes());
            decoder dec { enc.bytes() };
            expect_equal(uint32_t { 0x01020304 }, dec.uint_fixed<uint32_t>());
            expect_equal(uint16_t { 0xABCD }, dec.uint_fixed<uint16_t>());
            bool b = false;
            dec.process(b);
            expect(b);
            expect(throws([&] { std::ignore = dec.next(); }));
            expect(throws([] {
                decoder bad { uint8_vector::from_hex("02") };
                bool v;
                bad.process(v);
            }));
        };
        "non-canonical varlen values are rejected"_test = [] {
            for (const auto hex: { "8005", "C00001", "FF0100000000000000" }) {
                expect(throws([&] {
                    decoder dec { uint8_vector::from_hex(hex) };
                    std::ignore = dec.uint_varlen();
                })) << hex;
            }
        };
        "maps are written in key order"_test = [] {
            version_tracker_t tracker {};
            for (const uint64_t k: { 7, 3, 1 })
                tracker.emplace(k, static_cast<uint32_t>(k * 10));
            expect_equal(uint8_vector::from_hex("03" "0100000000000000" "0A000000" "0300000000000000" "1E000000" "0700000000000000" "46000000"),
                to_bytes(tracker));
        };
        "account ids are length-prefixed"_test = [] {
            const account_id_t id { "ab.c" };
            const auto bytes = to_bytes(id);
            expect_equal(uint8_vector::from_hex("04" "61622E63"), bytes);
            expect_equal(id, from_bytes<account_id_t>(bytes));
            expect(throws([] { std::ignore = from_bytes<account_id_t>(uint8_vector::from_hex("04" "6162")); }));
            expect(throws([] { std::ignore = from_bytes<account_id_t>(uint8_vector::from_hex("04" "61622E63" "00")); }));
        };
        "non-canonical maps are rejected"_test = [] {
            // two entries of a validator_id -> protocol_version map with keys 2 and 1
            const auto unsorted = uint8_vector::from_hex("02" "0200000000000000" "05000000" "0100000000000000" "06000000");
            expect(throws([&] { std::ignore = from_bytes<version_tracker_t>(unsorted); }));
            const auto duplicate = uint8_vector::from_hex("02" "0100000000000000" "05000000" "0100000000000000" "06000000");
            expect(throws([&] { std::ignore = from_bytes<version_tracker_t>(duplicate); }));
            const auto sorted = uint8_vector::from_hex("02" "0100000000000000" "05000000" "0200000000000000" "06000000");
            expect_equal(version_tracker_t { { 1, 5 }, { 2, 6 } }, from_bytes<version_tracker_t>(sorted));
        };
        "array size exceeding the input"_test = [] {
            expect(throws([] { std::ignore = from_bytes<settlement_t>(uint8_vector::from_hex("8FFF")); }));
        };
    };
};
