/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <epochwise/common/cli.hpp>
#include <epochwise/epoch/checkpoint.hpp>
#include <epochwise/epoch/range-builder.hpp>

namespace epochwise::cli::epoch_aggregate {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "epoch-aggregate";
            cmd.desc = "Aggregate the production statistics and proposals of the block digests in <blocks.json>";
            cmd.args.expect({ "<config.json>", "<blocks.json>" });
            cmd.opts.try_emplace("workers", option_config {
                "the number of concurrent aggregation tasks; with more than one, a proposal or version key repeated across"
                " slices keeps the entry of the later slice, so the state hash can differ from a single-task run",
                "1", validate_positive_uint });
            cmd.opts.try_emplace("checkpoint", option_config {
                "save the resulting state as a checkpoint at the given path", {},
                [](const std::optional<std::string> &val) -> std::optional<std::string> {
                    if (!val || val->empty())
                        return "a path is required";
                    return {};
                }
            });
        }

        void run(const arguments &args, const options &opts) const override
        {
            using namespace epochwise::epoch;
            const auto cfg = epoch_config_t::load(args.at(0));
            const auto range = block_range_t::load(args.at(1));
            const auto workers = std::stoull(*opts.at("workers"));
            if (workers > 1)
                logger::warn("aggregating with {} tasks: repeated proposal or version keys keep the latest slice's entry"
                    " and the state hash may differ from a single-task run", workers);
            const auto agg = workers > 1
                ? aggregate_parallel(cfg, cfg.epoch_id, range.start_hash, range.prev_height, range.blocks, workers)
                : aggregate_range(cfg, cfg.epoch_id, range.start_hash, range.prev_height, range.blocks);
            logger::info("epoch {}: aggregated {} blocks following height {}", cfg.epoch_id, range.blocks.size(), range.prev_height);
            logger::info("{}", codec::json::serialize_pretty(agg.to_json()));
            logger::info("state hash: {}", agg.state_hash());
            if (const auto cp_it = opts.find("checkpoint"); cp_it != opts.end() && cp_it->second)
                checkpoint::save(*cp_it->second, agg);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
