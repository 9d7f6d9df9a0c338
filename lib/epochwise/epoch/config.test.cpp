/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "assignment.hpp"
#include "test-vectors.hpp"

namespace {
    using namespace epochwise;
    using namespace epochwise::epoch;
    using namespace epochwise::epoch::test;

    const std::string_view sample_config_json = R"({
        "epoch_id": "0xe1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1",
        "epoch_height": 4320,
        "protocol_version": 70,
        "validators": [
            { "account_id": "alice", "public_key": "0x0101010101010101010101010101010101010101010101010101010101010101", "pledge": "1000" },
            { "account_id": "bob", "public_key": "0x0202020202020202020202020202020202020202020202020202020202020202", "pledge": "2000" },
            { "account_id": "carol", "public_key": "0x0303030303030303030303030303030303030303030303030303030303030303", "pledge": "3000" }
        ],
        "block_producers_settlement": [0, 1, 2, 1],
        "chunk_producers_settlement": [[2, 0], [1]]
    })";
}

suite epochwise_epoch_config_suite = [] {
    "epochwise::epoch::config"_test = [] {
        "load"_test = [] {
            const file::tmp_directory tmp { "epochwise-config-test" };
            const auto path = tmp.file("config.json");
            file::write(path, sample_config_json);
            const auto cfg = epoch_config_t::load(path);
            expect_equal(hash_of(0xE1), cfg.epoch_id);
            expect_equal(block_height_t { 4320 }, cfg.epoch_height);
            expect_equal(size_t { 3 }, cfg.validators.size());
            expect_equal(balance_t { 2000 }, cfg.validators[1].pledge);
            expect_equal(size_t { 2 }, cfg.num_shards());
            expect_equal(account_id_t { "carol" }, cfg.validator_account_id(2));
            expect(throws([&] { std::ignore = cfg.validator_account_id(3); }));
            expect(throws([&] { epoch_config_t::load(tmp.file("missing.json")); }));
        };
        "validation"_test = [] {
            const auto base = codec::json::parse(sample_config_json);
            const auto check_invalid = [&](const std::function<void(boost::json::object &)> &modify, const std::string_view name) {
                auto jv = base;
                modify(jv.as_object());
                expect(throws([&] { epoch_config_t::from_json(jv); })) << name;
            };
            check_invalid([](auto &o) { o["block_producers_settlement"] = boost::json::array {}; }, "empty block settlement");
            check_invalid([](auto &o) { o["block_producers_settlement"] = boost::json::array { 0, 3 }; }, "unknown block producer");
            check_invalid([](auto &o) { o["chunk_producers_settlement"] = boost::json::array {}; }, "no shards");
            check_invalid([](auto &o) { o["chunk_producers_settlement"].as_array()[1] = boost::json::array {}; }, "empty shard");
            check_invalid([](auto &o) { o["chunk_producers_settlement"].as_array()[0].as_array()[1] = 7; }, "unknown chunk producer");
            check_invalid([](auto &o) { o["validators"] = boost::json::array {}; }, "no validators");
            check_invalid([](auto &o) { o["validators"].as_array()[1].as_object()["account_id"] = "alice"; }, "duplicate account");
            check_invalid([](auto &o) { o["validators"].as_array()[0].as_object()["account_id"] = "Alice"; }, "invalid account");
            check_invalid([](auto &o) { o["validators"].as_array()[0].as_object()["pledge"] = "-5"; }, "negative pledge");
            check_invalid([](auto &o) { o.erase("epoch_id"); }, "missing epoch id");
            expect(nothrow([&] { std::ignore = epoch_config_t::from_json(base); }));
        };
        "assignment"_test = [] {
            const auto cfg = epoch_config_t::from_json(codec::json::parse(sample_config_json));
            using namespace assignment;
            expect_equal(validator_id_t { 0 }, block_producer(cfg, 0));
            expect_equal(validator_id_t { 1 }, block_producer(cfg, 3));
            expect_equal(validator_id_t { 2 }, block_producer(cfg, 4322));
            expect_equal(validator_id_t { 1 }, block_producer(cfg, std::numeric_limits<block_height_t>::max()));
            expect_equal(validator_id_t { 2 }, chunk_producer(cfg, 10, 0));
            expect_equal(validator_id_t { 0 }, chunk_producer(cfg, 11, 0));
            expect_equal(validator_id_t { 1 }, chunk_producer(cfg, 11, 1));
            expect(throws([&] { std::ignore = chunk_producer(cfg, 11, 2); }));
            // the same inputs always give the same answer
            for (block_height_t h = 4320; h < 4330; ++h)
                expect_equal(block_producer(cfg, h), block_producer(cfg, h));
        };
    };
};
