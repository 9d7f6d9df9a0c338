#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "types.hpp"

namespace epochwise::epoch {
    // The fields of an already validated block header that epoch accounting depends upon
    struct block_header_t {
        crypto_hash_t hash {};
        crypto_hash_t prev_hash {};
        block_height_t height = 0;
        crypto_hash_t random_value {};
        crypto_hash_t last_final_block {};
        power_proposal_list_t prev_validator_power_proposals {};
        pledge_proposal_list_t prev_validator_pledge_proposals {};
        bool_sequence_t chunk_mask {};
        balance_t total_supply {};
        protocol_version_t latest_protocol_version = 0;
        uint64_t raw_timestamp = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("hash"sv, hash);
            archive.process("prev_hash"sv, prev_hash);
            archive.process("height"sv, height);
            archive.process("random_value"sv, random_value);
            archive.process("last_final_block"sv, last_final_block);
            archive.process("prev_validator_power_proposals"sv, prev_validator_power_proposals);
            archive.process("prev_validator_pledge_proposals"sv, prev_validator_pledge_proposals);
            archive.process("chunk_mask"sv, chunk_mask);
            archive.process("total_supply"sv, total_supply);
            archive.process("latest_protocol_version"sv, latest_protocol_version);
            archive.process("raw_timestamp"sv, raw_timestamp);
        }

        bool operator==(const block_header_t &o) const = default;
    };

    struct block_digest_t {
        crypto_hash_t hash {};
        crypto_hash_t prev_hash {};
        block_height_t height = 0;
        crypto_hash_t random_value {};
        block_height_t last_finalized_height = 0;
        crypto_hash_t last_finalized_block_hash {};
        power_proposal_list_t power_proposals {};
        pledge_proposal_list_t pledge_proposals {};
        slashed_validator_list_t slashed_validators {};
        bool_sequence_t chunk_mask {};
        balance_t total_supply {};
        protocol_version_t latest_protocol_version = 0;
        uint64_t timestamp_nanosec = 0;

        // slashed_validators is left empty, it is filled in by the slashing logic when needed
        static block_digest_t from_header(const block_header_t &header, block_height_t last_finalized_height);

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("hash"sv, hash);
            archive.process("prev_hash"sv, prev_hash);
            archive.process("height"sv, height);
            archive.process("random_value"sv, random_value);
            archive.process("last_finalized_height"sv, last_finalized_height);
            archive.process("last_finalized_block_hash"sv, last_finalized_block_hash);
            archive.process("power_proposals"sv, power_proposals);
            archive.process("pledge_proposals"sv, pledge_proposals);
            archive.process("slashed_validators"sv, slashed_validators);
            archive.process("chunk_mask"sv, chunk_mask);
            archive.process("total_supply"sv, total_supply);
            archive.process("latest_protocol_version"sv, latest_protocol_version);
            archive.process("timestamp_nanosec"sv, timestamp_nanosec);
        }

        bool operator==(const block_digest_t &o) const = default;
    };
    using block_digest_list_t = sequence_t<block_digest_t>;
}
