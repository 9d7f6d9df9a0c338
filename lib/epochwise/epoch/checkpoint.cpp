/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <epochwise/common/file.hpp>
#include <epochwise/common/logger.hpp>
#include <epochwise/crypto/blake2b.hpp>
#include "checkpoint.hpp"

namespace epochwise::epoch::checkpoint {
    uint8_vector encode(const epoch_aggregator_t &agg)
    {
        const auto state = agg.to_bytes();
        encoder enc {};
        enc.process_bytes_fixed(buffer { magic });
        enc.process(format_version);
        enc.process_bytes_fixed(crypto::blake2b::digest<crypto_hash_t>(state));
        enc.process_bytes_fixed(state);
        return std::move(enc.bytes());
    }

    epoch_aggregator_t decode(const buffer bytes)
    {
        if (bytes.size() < header_size) [[unlikely]]
            throw error(fmt::format("a checkpoint must have at least {} bytes but got {}", header_size, bytes.size()));
        decoder dec { bytes };
        if (const auto m = dec.next_bytes(magic.size()); m != buffer { magic }) [[unlikely]]
            throw error(fmt::format("an unexpected checkpoint magic: {}", m));
        if (const auto ver = dec.uint_fixed<uint32_t>(); ver != format_version) [[unlikely]]
            throw error(fmt::format("unsupported checkpoint format version: {}", ver));
        const crypto_hash_t exp_hash { dec.next_bytes(sizeof(crypto_hash_t)) };
        const auto state = dec.next_bytes(dec.size());
        if (const auto act_hash = crypto::blake2b::digest<crypto_hash_t>(state); act_hash != exp_hash) [[unlikely]]
            throw error(fmt::format("checkpoint state hash mismatch: expected {} got {}", exp_hash, act_hash));
        return epoch_aggregator_t::from_bytes(state);
    }

    void save(const std::string &path, const epoch_aggregator_t &agg)
    {
        const auto bytes = encode(agg);
        const auto tmp_path = fmt::format("{}.tmp", path);
        file::write(tmp_path, bytes);
        file::rename(tmp_path, path);
        logger::info("saved a checkpoint of epoch {} to {}: {} bytes", agg.epoch_id(), path, bytes.size());
    }

    epoch_aggregator_t load(const std::string &path)
    {
        try {
            return decode(file::read(path));
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to load a checkpoint from {}", path), ex);
        }
    }
}
