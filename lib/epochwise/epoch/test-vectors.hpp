#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <epochwise/common/test.hpp>
#include "block-digest.hpp"
#include "config.hpp"

namespace epochwise::epoch::test {
    inline crypto_hash_t hash_of(const uint8_t tag)
    {
        crypto_hash_t h {};
        h.fill(tag);
        return h;
    }

    // four validators: alice=0, bob=1, carol=2 and dave=3
    inline epoch_config_t make_config(settlement_t block_producers, shard_settlements_t chunk_producers, const uint8_t epoch_tag=0xE1)
    {
        epoch_config_t cfg {};
        cfg.epoch_id = hash_of(epoch_tag);
        cfg.epoch_height = 1;
        cfg.protocol_version = 70;
        for (const auto &name: { "alice", "bob", "carol", "dave" }) {
            cfg.validators.emplace_back(validator_info_t {
                .account_id = name,
                .public_key = hash_of(static_cast<uint8_t>(cfg.validators.size() + 1)),
                .pledge = balance_t { 1000 }
            });
        }
        cfg.block_producers_settlement = std::move(block_producers);
        cfg.chunk_producers_settlement = std::move(chunk_producers);
        return cfg;
    }

    // block producers rotate with height % 4, shard 0 starts from bob and shard 1 from carol
    inline epoch_config_t default_config()
    {
        return make_config({ 0, 1, 2, 3 }, { { 1, 2, 3, 0 }, { 2, 3, 0, 1 } });
    }

    inline block_digest_t make_digest(const block_height_t height, bool_sequence_t chunk_mask,
        const protocol_version_t version=70)
    {
        block_digest_t d {};
        d.hash = hash_of(static_cast<uint8_t>(height));
        d.prev_hash = hash_of(static_cast<uint8_t>(height - 1));
        d.height = height;
        d.chunk_mask = std::move(chunk_mask);
        d.latest_protocol_version = version;
        d.total_supply = balance_t { 1'000'000 };
        d.timestamp_nanosec = height * 1'000'000'000ULL;
        return d;
    }

    inline validator_power_t power_proposal(const std::string_view account, const power_t power)
    {
        return { account_id_t { account }, hash_of(0xAA), power };
    }

    inline validator_pledge_t pledge_proposal(const std::string_view account, const uint64_t pledge)
    {
        return { account_id_t { account }, hash_of(0xBB), balance_t { pledge } };
    }
}
