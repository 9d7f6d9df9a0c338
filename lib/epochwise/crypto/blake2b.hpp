#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <epochwise/common/bytes.hpp>

namespace epochwise::crypto::blake2b {
    using hash_t = byte_array<32>;

    // unkeyed BLAKE2b with a 32-byte output
    extern hash_t hash256(buffer in);

    template<typename T=hash_t>
    T digest(const buffer in)
    {
        static_assert(sizeof(T) == sizeof(hash_t));
        return T { static_cast<buffer>(hash256(in)) };
    }
}
