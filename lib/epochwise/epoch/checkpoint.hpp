#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "aggregator.hpp"

// Checkpoint layout: magic(4) | format version(u32 LE) | blake2b-256 of the state(32) | canonical state encoding
namespace epochwise::epoch::checkpoint {
    static constexpr std::string_view magic { "EWCP" };
    static constexpr uint32_t format_version = 1;
    static constexpr size_t header_size = 4 + 4 + 32;

    extern uint8_vector encode(const epoch_aggregator_t &agg);
    extern epoch_aggregator_t decode(buffer bytes);
    // writes to a temporary file first so that an existing checkpoint is replaced only by a complete one
    extern void save(const std::string &path, const epoch_aggregator_t &agg);
    extern epoch_aggregator_t load(const std::string &path);
}
