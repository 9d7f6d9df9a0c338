#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "config.hpp"

// Stateless lookups of the validator assigned to produce a block or a chunk.
// Both are total over heights since the settlements repeat cyclically.
namespace epochwise::epoch::assignment {
    extern validator_id_t block_producer(const epoch_config_t &cfg, block_height_t height);
    extern validator_id_t chunk_producer(const epoch_config_t &cfg, block_height_t height, shard_id_t shard);
}
