/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "block-digest.hpp"
#include "test-vectors.hpp"

namespace {
    using namespace epochwise;
    using namespace epochwise::epoch;
    using namespace epochwise::epoch::test;
}

suite epochwise_epoch_block_digest_suite = [] {
    "epochwise::epoch::block_digest"_test = [] {
        block_header_t header {};
        header.hash = hash_of(0x11);
        header.prev_hash = hash_of(0x10);
        header.height = 17;
        header.random_value = hash_of(0x77);
        header.last_final_block = hash_of(0x0E);
        header.prev_validator_power_proposals = { power_proposal("alice", 5) };
        header.prev_validator_pledge_proposals = { pledge_proposal("bob", 50), pledge_proposal("carol", 60) };
        header.chunk_mask = { true, false, true };
        header.total_supply = balance_t::from_string("1000000000000000000000000000");
        header.latest_protocol_version = 71;
        header.raw_timestamp = 1'700'000'000'000'000'000ULL;

        "from_header"_test = [&] {
            const auto d = block_digest_t::from_header(header, 14);
            expect_equal(header.hash, d.hash);
            expect_equal(header.prev_hash, d.prev_hash);
            expect_equal(block_height_t { 17 }, d.height);
            expect_equal(header.random_value, d.random_value);
            expect_equal(block_height_t { 14 }, d.last_finalized_height);
            expect_equal(header.last_final_block, d.last_finalized_block_hash);
            expect_equal(header.prev_validator_power_proposals, d.power_proposals);
            expect_equal(header.prev_validator_pledge_proposals, d.pledge_proposals);
            expect(d.slashed_validators.empty());
            expect_equal(header.chunk_mask, d.chunk_mask);
            expect_equal(header.total_supply, d.total_supply);
            expect_equal(protocol_version_t { 71 }, d.latest_protocol_version);
            expect_equal(header.raw_timestamp, d.timestamp_nanosec);
        };
        "json round trip"_test = [&] {
            auto d = block_digest_t::from_header(header, 14);
            d.slashed_validators = { slashed_validator_t { account_id_t { "dave" }, true } };
            const auto jv = codec::json::to_value(d);
            expect_equal(std::string_view { "0x1111111111111111111111111111111111111111111111111111111111111111" },
                std::string_view { jv.as_object().at("hash").as_string() });
            expect_equal(std::string_view { "1000000000000000000000000000" }, std::string_view { jv.as_object().at("total_supply").as_string() });
            expect_equal(d, codec::json::from_value<block_digest_t>(jv));
        };
        "binary round trip"_test = [&] {
            const auto d = block_digest_t::from_header(header, 14);
            const auto bytes = to_bytes(d);
            const auto decoded = from_bytes<block_digest_t>(bytes);
            expect_equal(d, decoded);
            expect_equal(bytes, to_bytes(decoded));
        };
    };
};
