#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <filesystem>
#include <string>
#include <string_view>
#include "bytes.hpp"

namespace epochwise::file {
    struct tmp_directory {
        explicit tmp_directory(const std::string_view name);
        ~tmp_directory();

        tmp_directory(const tmp_directory &) =delete;
        tmp_directory &operator=(const tmp_directory &) =delete;

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }

        [[nodiscard]] std::string file(const std::string_view name) const
        {
            return (std::filesystem::path { _path } / name).string();
        }
    private:
        std::string _path;
    };

    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, const buffer data);
    extern void rename(const std::string &from, const std::string &to);
}
