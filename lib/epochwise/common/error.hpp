#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <stdexcept>
#include <string_view>

namespace epochwise {
    // A recoverable failure: invalid input, an unreadable file or a broken caller contract
    struct error: std::runtime_error {
        explicit error(std::string_view msg);
        error(std::string_view msg, const std::exception &cause);
    };

    // Appends errno and its description to the message
    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}
