#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <concepts>

namespace epochwise::codec {
    // The common base of the binary and JSON archives. A type is serializable when it lists its fields
    // through serialize(auto &archive): archive.process(name, field) for each field in the canonical order.
    struct archive_t {
    };

    template<typename T>
    concept serializable_c = requires(T t, archive_t a)
    {
        { t.serialize(a) } -> std::same_as<void>;
    };

    template<typename T>
    T from(auto &archive)
    {
        T res {};
        res.serialize(archive);
        return res;
    }
}
