#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "types.hpp"

namespace epochwise::epoch {
    struct validator_info_t {
        account_id_t account_id {};
        public_key_t public_key {};
        balance_t pledge {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("account_id"sv, account_id);
            archive.process("public_key"sv, public_key);
            archive.process("pledge"sv, pledge);
        }

        bool operator==(const validator_info_t &o) const = default;
    };
    using validator_info_list_t = sequence_t<validator_info_t>;

    using settlement_t = sequence_t<validator_id_t>;
    using shard_settlements_t = sequence_t<settlement_t>;

    // The immutable per-epoch configuration: the validator set and the producer settlements.
    // A validator's id is its index in the validators list.
    struct epoch_config_t {
        epoch_id_t epoch_id {};
        block_height_t epoch_height = 0;
        protocol_version_t protocol_version = 0;
        validator_info_list_t validators {};
        settlement_t block_producers_settlement {};
        shard_settlements_t chunk_producers_settlement {};

        static epoch_config_t load(const std::string &path);
        static epoch_config_t from_json(const boost::json::value &jv);

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("epoch_id"sv, epoch_id);
            archive.process("epoch_height"sv, epoch_height);
            archive.process("protocol_version"sv, protocol_version);
            archive.process("validators"sv, validators);
            archive.process("block_producers_settlement"sv, block_producers_settlement);
            archive.process("chunk_producers_settlement"sv, chunk_producers_settlement);
        }

        void validate() const;

        [[nodiscard]] size_t num_shards() const noexcept
        {
            return chunk_producers_settlement.size();
        }

        [[nodiscard]] const account_id_t &validator_account_id(validator_id_t id) const;

        bool operator==(const epoch_config_t &o) const = default;
    };
}
