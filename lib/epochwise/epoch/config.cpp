/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <set>
#include <epochwise/common/logger.hpp>
#include "config.hpp"

namespace epochwise::epoch {
    epoch_config_t epoch_config_t::load(const std::string &path)
    {
        try {
            auto cfg = from_json(codec::json::load(path));
            logger::debug("loaded the config of epoch {} with {} validators and {} shards from {}",
                cfg.epoch_id, cfg.validators.size(), cfg.num_shards(), path);
            return cfg;
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to load an epoch config from {}", path), ex);
        }
    }

    epoch_config_t epoch_config_t::from_json(const boost::json::value &jv)
    {
        codec::json::decoder dec { jv };
        auto cfg = codec::from<epoch_config_t>(dec);
        cfg.validate();
        return cfg;
    }

    void epoch_config_t::validate() const
    {
        if (validators.empty()) [[unlikely]]
            throw error("an epoch config must have at least one validator");
        std::set<account_id_t> accounts {};
        for (size_t i = 0; i < validators.size(); ++i) {
            if (!accounts.emplace(validators[i].account_id).second) [[unlikely]]
                throw error(fmt::format("validator #{} reuses the account id {}", i, validators[i].account_id));
        }
        if (block_producers_settlement.empty()) [[unlikely]]
            throw error("the block producers settlement must not be empty");
        for (size_t i = 0; i < block_producers_settlement.size(); ++i) {
            if (block_producers_settlement[i] >= validators.size()) [[unlikely]]
                throw error(fmt::format("block producers settlement item #{} references an unknown validator {}", i, block_producers_settlement[i]));
        }
        if (chunk_producers_settlement.empty()) [[unlikely]]
            throw error("the chunk producers settlement must have at least one shard");
        for (size_t shard = 0; shard < chunk_producers_settlement.size(); ++shard) {
            const auto &s = chunk_producers_settlement[shard];
            if (s.empty()) [[unlikely]]
                throw error(fmt::format("the chunk producers settlement of shard {} must not be empty", shard));
            for (size_t i = 0; i < s.size(); ++i) {
                if (s[i] >= validators.size()) [[unlikely]]
                    throw error(fmt::format("chunk producers settlement of shard {} item #{} references an unknown validator {}", shard, i, s[i]));
            }
        }
    }

    const account_id_t &epoch_config_t::validator_account_id(const validator_id_t id) const
    {
        if (id >= validators.size()) [[unlikely]]
            throw error(fmt::format("unknown validator id {} while the epoch has {} validators", id, validators.size()));
        return validators[id].account_id;
    }
}
