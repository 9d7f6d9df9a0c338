/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "assignment.hpp"

namespace epochwise::epoch::assignment {
    validator_id_t block_producer(const epoch_config_t &cfg, const block_height_t height)
    {
        const auto &s = cfg.block_producers_settlement;
        if (s.empty()) [[unlikely]]
            throw error("block_producer: the block producers settlement is empty");
        return s[height % s.size()];
    }

    validator_id_t chunk_producer(const epoch_config_t &cfg, const block_height_t height, const shard_id_t shard)
    {
        if (shard >= cfg.chunk_producers_settlement.size()) [[unlikely]]
            throw error(fmt::format("chunk_producer: shard {} is out of range, the epoch has {} shards", shard, cfg.chunk_producers_settlement.size()));
        const auto &s = cfg.chunk_producers_settlement[shard];
        if (s.empty()) [[unlikely]]
            throw error(fmt::format("chunk_producer: the chunk producers settlement of shard {} is empty", shard));
        return s[height % s.size()];
    }
}
