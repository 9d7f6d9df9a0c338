#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "aggregator.hpp"

namespace epochwise::epoch {
    // A list of consecutive block digests following the block at prev_height whose hash is start_hash
    struct block_range_t {
        block_height_t prev_height = 0;
        crypto_hash_t start_hash {};
        block_digest_list_t blocks {};

        static block_range_t load(const std::string &path);

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("prev_height"sv, prev_height);
            archive.process("start_hash"sv, start_hash);
            archive.process("blocks"sv, blocks);
        }

        bool operator==(const block_range_t &o) const = default;
    };

    // Throws if the digest heights are not strictly increasing starting above prev_height.
    extern void validate_range(block_height_t prev_height, const block_digest_list_t &digests);

    // Aggregates digests, which must follow the block at prev_height, one after another.
    // The result's last_block_hash is the hash of the last digest or start_hash when there are none.
    extern epoch_aggregator_t aggregate_range(const epoch_config_t &cfg, const epoch_id_t &epoch_id,
        const crypto_hash_t &start_hash, block_height_t prev_height, const block_digest_list_t &digests);

    // The same result as aggregate_range but computed by up to num_workers concurrent tasks,
    // each over its own contiguous slice of the digests.
    extern epoch_aggregator_t aggregate_parallel(const epoch_config_t &cfg, const epoch_id_t &epoch_id,
        const crypto_hash_t &start_hash, block_height_t prev_height, const block_digest_list_t &digests, size_t num_workers);
}
