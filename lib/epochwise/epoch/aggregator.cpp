/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <exception>
#include <epochwise/common/logger.hpp>
#include <epochwise/crypto/blake2b.hpp>
#include "aggregator.hpp"
#include "assignment.hpp"

namespace epochwise::epoch {
    block_tracker_t combine(block_tracker_t a, const block_tracker_t &b)
    {
        for (const auto &[validator_id, stats]: b)
            a[validator_id] += stats;
        return a;
    }

    shard_tracker_t combine(shard_tracker_t a, const shard_tracker_t &b)
    {
        for (const auto &[shard_id, validators]: b) {
            auto &dst = a[shard_id];
            dst = combine(std::move(dst), validators);
        }
        return a;
    }

    epoch_aggregator_t epoch_aggregator_t::from_bytes(const buffer bytes)
    {
        return epoch::from_bytes<epoch_aggregator_t>(bytes);
    }

    epoch_aggregator_t::epoch_aggregator_t(const epoch_id_t &epoch_id, const crypto_hash_t &last_block_hash):
        _epoch_id { epoch_id },
        _last_block_hash { last_block_hash }
    {
    }

    void epoch_aggregator_t::update_tail(const block_digest_t &digest, const epoch_config_t &cfg, const block_height_t prev_height)
    {
        if (digest.height <= prev_height) [[unlikely]]
            throw error(fmt::format("update_tail: block height {} must be greater than the previous height {}", digest.height, prev_height));

        // the block's counters are staged and committed only once every lookup has succeeded
        block_tracker_t blocks {};
        for (auto height = prev_height + 1; height < digest.height; ++height) {
            const auto producer_id = assignment::block_producer(cfg, height);
            logger::debug("missed block at height {} by {}", height, cfg.validator_account_id(producer_id));
            blocks[producer_id] += validator_stats_t { 0, 1 };
        }
        const auto producer_id = assignment::block_producer(cfg, digest.height);
        blocks[producer_id] += validator_stats_t { 1, 1 };

        // chunks are attributed to the producers of the height right after the previous block
        const auto chunk_height = prev_height + 1;
        shard_tracker_t chunks {};
        for (shard_id_t shard_id = 0; shard_id < digest.chunk_mask.size(); ++shard_id) {
            const auto chunk_producer_id = assignment::chunk_producer(cfg, chunk_height, shard_id);
            const bool included = digest.chunk_mask[shard_id];
            if (!included)
                logger::debug("missed chunk at height {} shard {} by {}", chunk_height, shard_id, cfg.validator_account_id(chunk_producer_id));
            chunks[shard_id][chunk_producer_id] += validator_stats_t { static_cast<uint64_t>(included), 1 };
        }

        _block_tracker = combine(std::move(_block_tracker), blocks);
        _shard_tracker = combine(std::move(_shard_tracker), chunks);
        _version_tracker.try_emplace(producer_id, digest.latest_protocol_version);

        for (const auto &p: digest.power_proposals)
            _power_proposals.try_emplace(p.account_id, p);
        for (const auto &p: digest.pledge_proposals)
            _pledge_proposals.try_emplace(p.account_id, p);
    }

    void epoch_aggregator_t::extend_suffix(epoch_aggregator_t other)
    {
        _merge_common(other);
        // the entries of the later range replace the earlier ones
        for (auto &[k, v]: other._version_tracker)
            _version_tracker.insert_or_assign(k, v);
        for (auto &[k, v]: other._power_proposals)
            _power_proposals.insert_or_assign(k, std::move(v));
        for (auto &[k, v]: other._pledge_proposals)
            _pledge_proposals.insert_or_assign(k, std::move(v));
        _last_block_hash = other._last_block_hash;
    }

    void epoch_aggregator_t::extend_prefix(const epoch_aggregator_t &other)
    {
        _merge_common(other);
        // the entries of this, the later range, are never replaced
        for (const auto &[k, v]: other._version_tracker)
            _version_tracker.try_emplace(k, v);
        for (const auto &[k, v]: other._power_proposals)
            _power_proposals.try_emplace(k, v);
        for (const auto &[k, v]: other._pledge_proposals)
            _pledge_proposals.try_emplace(k, v);
    }

    void epoch_aggregator_t::_merge_common(const epoch_aggregator_t &other)
    {
        if (_epoch_id != other._epoch_id) [[unlikely]] {
            // combining the statistics of different epochs is a defect of the caller and is not recoverable
            logger::error("cannot combine aggregators of different epochs: {} and {}", _epoch_id, other._epoch_id);
            logger::get().flush();
            std::terminate();
        }
        _block_tracker = combine(std::move(_block_tracker), other._block_tracker);
        _shard_tracker = combine(std::move(_shard_tracker), other._shard_tracker);
    }

    uint8_vector epoch_aggregator_t::to_bytes() const
    {
        return epoch::to_bytes(*this);
    }

    crypto_hash_t epoch_aggregator_t::state_hash() const
    {
        return crypto::blake2b::digest<crypto_hash_t>(to_bytes());
    }

    boost::json::value epoch_aggregator_t::to_json() const
    {
        using codec::json::to_value;
        return boost::json::object {
            { "epoch_id", to_value(_epoch_id) },
            { "last_block_hash", to_value(_last_block_hash) },
            { "block_tracker", to_value(_block_tracker) },
            { "shard_tracker", to_value(_shard_tracker) },
            { "version_tracker", to_value(_version_tracker) },
            { "power_proposals", to_value(_power_proposals) },
            { "pledge_proposals", to_value(_pledge_proposals) }
        };
    }

    epoch_aggregator_t compose(const epoch_aggregator_t &prefix, const epoch_aggregator_t &suffix)
    {
        epoch_aggregator_t res { prefix };
        res.extend_suffix(suffix);
        return res;
    }
}
