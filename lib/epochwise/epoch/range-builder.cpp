/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <future>
#include <optional>
#include <epochwise/common/logger.hpp>
#include <epochwise/common/timer.hpp>
#include "range-builder.hpp"

namespace epochwise::epoch {
    namespace {
        epoch_aggregator_t aggregate_slice(const epoch_config_t &cfg, const epoch_id_t &epoch_id,
            block_height_t prev_height, const std::span<const block_digest_t> digests)
        {
            epoch_aggregator_t agg { epoch_id, digests.back().hash };
            for (const auto &d: digests) {
                agg.update_tail(d, cfg, prev_height);
                prev_height = d.height;
            }
            return agg;
        }
    }

    block_range_t block_range_t::load(const std::string &path)
    {
        try {
            auto range = codec::json::load_obj<block_range_t>(path);
            logger::debug("loaded {} block digests following height {} from {}", range.blocks.size(), range.prev_height, path);
            return range;
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to load block digests from {}", path), ex);
        }
    }

    void validate_range(block_height_t prev_height, const block_digest_list_t &digests)
    {
        for (size_t i = 0; i < digests.size(); ++i) {
            if (digests[i].height <= prev_height) [[unlikely]]
                throw error(fmt::format("digest #{} has height {} that does not follow the previous height {}", i, digests[i].height, prev_height));
            prev_height = digests[i].height;
        }
    }

    epoch_aggregator_t aggregate_range(const epoch_config_t &cfg, const epoch_id_t &epoch_id,
        const crypto_hash_t &start_hash, const block_height_t prev_height, const block_digest_list_t &digests)
    {
        validate_range(prev_height, digests);
        if (digests.empty())
            return { epoch_id, start_hash };
        return aggregate_slice(cfg, epoch_id, prev_height, digests);
    }

    epoch_aggregator_t aggregate_parallel(const epoch_config_t &cfg, const epoch_id_t &epoch_id,
        const crypto_hash_t &start_hash, const block_height_t prev_height, const block_digest_list_t &digests, const size_t num_workers)
    {
        validate_range(prev_height, digests);
        if (digests.empty())
            return { epoch_id, start_hash };
        const size_t num_tasks = std::min(std::max(num_workers, size_t { 1 }), digests.size());
        timer t { fmt::format("aggregate {} digests with {} tasks", digests.size(), num_tasks), logger::level::debug };
        const std::span<const block_digest_t> all { digests };

        std::vector<std::future<epoch_aggregator_t>> tasks {};
        tasks.reserve(num_tasks);
        for (size_t i = 0; i < num_tasks; ++i) {
            const size_t start = digests.size() * i / num_tasks;
            const size_t end = digests.size() * (i + 1) / num_tasks;
            const auto slice_prev_height = start > 0 ? digests[start - 1].height : prev_height;
            tasks.emplace_back(std::async(std::launch::async, [&cfg, &epoch_id, slice_prev_height, slice = all.subspan(start, end - start)] {
                return aggregate_slice(cfg, epoch_id, slice_prev_height, slice);
            }));
        }

        std::optional<epoch_aggregator_t> res {};
        std::exception_ptr first_ex {};
        for (auto &task: tasks) {
            auto ex = logger::run_log_errors([&] {
                auto part = task.get();
                if (!res)
                    res.emplace(std::move(part));
                else
                    res->extend_suffix(std::move(part));
            });
            if (ex && !first_ex)
                first_ex = std::move(ex);
        }
        if (first_ex) [[unlikely]]
            std::rethrow_exception(first_ex);
        return std::move(*res);
    }
}
