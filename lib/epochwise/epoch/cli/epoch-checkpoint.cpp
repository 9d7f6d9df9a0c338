/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <epochwise/common/cli.hpp>
#include <epochwise/epoch/checkpoint.hpp>

namespace epochwise::cli::epoch_checkpoint {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "epoch-checkpoint";
            cmd.desc = "Verify the checkpoint at <path> and print the aggregated state it holds";
            cmd.args.expect({ "<path>" });
        }

        void run(const arguments &args) const override
        {
            using namespace epochwise::epoch;
            const auto agg = checkpoint::load(args.at(0));
            logger::info("{}", codec::json::serialize_pretty(agg.to_json()));
            logger::info("checkpoint {} is valid, epoch: {} state hash: {}", args.at(0), agg.epoch_id(), agg.state_hash());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
