/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "block-digest.hpp"

namespace epochwise::epoch {
    block_digest_t block_digest_t::from_header(const block_header_t &header, const block_height_t last_finalized_height)
    {
        return {
            .hash = header.hash,
            .prev_hash = header.prev_hash,
            .height = header.height,
            .random_value = header.random_value,
            .last_finalized_height = last_finalized_height,
            .last_finalized_block_hash = header.last_final_block,
            .power_proposals = header.prev_validator_power_proposals,
            .pledge_proposals = header.prev_validator_pledge_proposals,
            .slashed_validators = {},
            .chunk_mask = header.chunk_mask,
            .total_supply = header.total_supply,
            .latest_protocol_version = header.latest_protocol_version,
            .timestamp_nanosec = header.raw_timestamp
        };
    }
}
