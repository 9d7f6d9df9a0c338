/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdio>
#include <memory>
#include "file.hpp"

namespace epochwise::file {
    tmp_directory::tmp_directory(const std::string_view name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
        std::filesystem::remove_all(_path);
        std::filesystem::create_directories(_path);
    }

    tmp_directory::~tmp_directory()
    {
        std::error_code ec {};
        std::filesystem::remove_all(_path, ec);
    }

    uint8_vector read(const std::string &path)
    {
        std::unique_ptr<FILE, decltype(&fclose)> f { fopen(path.c_str(), "rb"), &fclose };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {} for reading", path));
        if (fseek(f.get(), 0, SEEK_END) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to seek in {}", path));
        const auto sz = ftell(f.get());
        if (sz < 0) [[unlikely]]
            throw error_sys(fmt::format("failed to tell the stream position in {}", path));
        if (fseek(f.get(), 0, SEEK_SET) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to seek in {}", path));
        uint8_vector data(static_cast<size_t>(sz));
        if (!data.empty() && fread(data.data(), 1, data.size(), f.get()) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", data.size(), path));
        return data;
    }

    void write(const std::string &path, const buffer data)
    {
        const std::filesystem::path p { path };
        if (p.has_parent_path())
            std::filesystem::create_directories(p.parent_path());
        std::unique_ptr<FILE, decltype(&fclose)> f { fopen(path.c_str(), "wb"), &fclose };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {} for writing", path));
        if (!data.empty() && fwrite(data.data(), 1, data.size(), f.get()) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
        if (fflush(f.get()) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to flush {}", path));
    }

    void rename(const std::string &from, const std::string &to)
    {
        std::error_code ec {};
        std::filesystem::rename(from, to, ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("failed to rename {} to {}: {}", from, to, ec.message()));
    }
}
