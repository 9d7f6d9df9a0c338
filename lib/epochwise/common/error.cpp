/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <cstring>
#include <string>
#include <fmt/format.h>
#include "error.hpp"

namespace epochwise {
    namespace {
        std::string with_errno(const std::string_view msg)
        {
            const auto err = errno;
            return fmt::format("{}: errno {} ({})", msg, err, std::strerror(err));
        }
    }

    error::error(const std::string_view msg):
        std::runtime_error { std::string { msg } }
    {
    }

    error::error(const std::string_view msg, const std::exception &cause):
        error { fmt::format("{}: {}", msg, cause.what()) }
    {
    }

    error_sys::error_sys(const std::string_view msg):
        error { with_errno(msg) }
    {
    }
}
