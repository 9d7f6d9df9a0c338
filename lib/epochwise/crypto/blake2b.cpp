/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <sodium.h>
#include "blake2b.hpp"

namespace epochwise::crypto::blake2b {
    namespace {
        void init_sodium()
        {
            // sodium_init is thread-safe and returns 1 when the library is already initialized
            static const int rc = sodium_init();
            if (rc < 0) [[unlikely]]
                throw error("libsodium could not be initialized");
        }
    }

    hash_t hash256(const buffer in)
    {
        init_sodium();
        hash_t out {};
        if (crypto_generichash_blake2b(out.data(), out.size(), in.data(), in.size(), nullptr, 0) != 0) [[unlikely]]
            throw error(fmt::format("blake2b failed over {} bytes", in.size()));
        return out;
    }
}
