#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "block-digest.hpp"
#include "config.hpp"

namespace epochwise::epoch {
    struct block_tracker_config_t: map_config_t {
        block_tracker_config_t(): map_config_t { "validator_id", "stats" } {}
    };
    using block_tracker_t = map_t<validator_id_t, validator_stats_t, block_tracker_config_t>;

    struct shard_tracker_config_t: map_config_t {
        shard_tracker_config_t(): map_config_t { "shard_id", "validators" } {}
    };
    using shard_tracker_t = map_t<shard_id_t, block_tracker_t, shard_tracker_config_t>;

    struct version_tracker_config_t: map_config_t {
        version_tracker_config_t(): map_config_t { "validator_id", "protocol_version" } {}
    };
    using version_tracker_t = map_t<validator_id_t, protocol_version_t, version_tracker_config_t>;

    struct power_proposals_config_t: map_config_t {
        power_proposals_config_t(): map_config_t { "account_id", "proposal" } {}
    };
    using power_proposals_t = map_t<account_id_t, validator_power_t, power_proposals_config_t>;

    struct pledge_proposals_config_t: map_config_t {
        pledge_proposals_config_t(): map_config_t { "account_id", "proposal" } {}
    };
    using pledge_proposals_t = map_t<account_id_t, validator_pledge_t, pledge_proposals_config_t>;

    // Additive combination of production counters. The result does not depend on the order of the arguments.
    extern block_tracker_t combine(block_tracker_t a, const block_tracker_t &b);
    extern shard_tracker_t combine(shard_tracker_t a, const shard_tracker_t &b);

    // Production statistics, protocol version votes and validator proposals
    // accumulated over a range of blocks of a single epoch.
    struct epoch_aggregator_t {
        static epoch_aggregator_t from_bytes(buffer bytes);

        epoch_aggregator_t() = default;
        epoch_aggregator_t(const epoch_id_t &epoch_id, const crypto_hash_t &last_block_hash);

        // Absorbs the heights (prev_height, digest.height]. The heights below digest.height had no block
        // and count only as expected for their block producers.
        void update_tail(const block_digest_t &digest, const epoch_config_t &cfg, block_height_t prev_height);

        // other must cover the range that immediately follows the one of this aggregator
        void extend_suffix(epoch_aggregator_t other);
        // other must cover the range that immediately precedes the one of this aggregator
        void extend_prefix(const epoch_aggregator_t &other);

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("epoch_id"sv, _epoch_id);
            archive.process("last_block_hash"sv, _last_block_hash);
            archive.process("block_tracker"sv, _block_tracker);
            archive.process("shard_tracker"sv, _shard_tracker);
            archive.process("version_tracker"sv, _version_tracker);
            archive.process("power_proposals"sv, _power_proposals);
            archive.process("pledge_proposals"sv, _pledge_proposals);
        }

        [[nodiscard]] uint8_vector to_bytes() const;
        [[nodiscard]] crypto_hash_t state_hash() const;
        [[nodiscard]] boost::json::value to_json() const;

        [[nodiscard]] const epoch_id_t &epoch_id() const noexcept
        {
            return _epoch_id;
        }

        [[nodiscard]] const crypto_hash_t &last_block_hash() const noexcept
        {
            return _last_block_hash;
        }

        [[nodiscard]] const block_tracker_t &block_tracker() const noexcept
        {
            return _block_tracker;
        }

        [[nodiscard]] const shard_tracker_t &shard_tracker() const noexcept
        {
            return _shard_tracker;
        }

        [[nodiscard]] const version_tracker_t &version_tracker() const noexcept
        {
            return _version_tracker;
        }

        [[nodiscard]] const power_proposals_t &power_proposals() const noexcept
        {
            return _power_proposals;
        }

        [[nodiscard]] const pledge_proposals_t &pledge_proposals() const noexcept
        {
            return _pledge_proposals;
        }

        bool operator==(const epoch_aggregator_t &o) const = default;
    private:
        epoch_id_t _epoch_id {};
        crypto_hash_t _last_block_hash {};
        block_tracker_t _block_tracker {};
        shard_tracker_t _shard_tracker {};
        version_tracker_t _version_tracker {};
        power_proposals_t _power_proposals {};
        pledge_proposals_t _pledge_proposals {};

        void _merge_common(const epoch_aggregator_t &other);
    };

    // An aggregator for the prefix range immediately followed by the suffix one
    extern epoch_aggregator_t compose(const epoch_aggregator_t &prefix, const epoch_aggregator_t &suffix);
}
