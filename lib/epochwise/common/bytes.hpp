#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <array>
#include <compare>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace epochwise {
    // A non-owning view of raw bytes ordered lexicographically
    struct buffer: std::span<const uint8_t> {
        buffer() = default;

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s):
            buffer { std::string_view { s } }
        {
        }

        operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            return std::lexicographical_compare_three_way(begin(), end(), o.begin(), o.end());
        }

        bool operator==(const buffer &o) const noexcept
        {
            return size() == o.size() && std::equal(begin(), end(), o.begin());
        }
    };

    // Fills out from exactly out.size() * 2 hex digits of either case
    inline void decode_hex(const std::span<uint8_t> out, const std::string_view hex)
    {
        static constexpr auto nibble = [](const char k) -> uint8_t {
            if (k >= '0' && k <= '9')
                return static_cast<uint8_t>(k - '0');
            if (k >= 'a' && k <= 'f')
                return static_cast<uint8_t>(k - 'a' + 10);
            if (k >= 'A' && k <= 'F')
                return static_cast<uint8_t>(k - 'A' + 10);
            throw error(fmt::format("not a hex digit: '{}'", k));
        };
        if (hex.size() != out.size() * 2) [[unlikely]]
            throw error(fmt::format("expected {} hex digits but got {}: {}", out.size() * 2, hex.size(), hex));
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = static_cast<uint8_t>(nibble(hex[2 * i]) << 4 | nibble(hex[2 * i + 1]));
    }

    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        static byte_array from_hex(const std::string_view hex)
        {
            byte_array res {};
            decode_hex(res, hex);
            return res;
        }

        byte_array() = default;

        byte_array(const std::initializer_list<uint8_t> bytes)
        {
            if (bytes.size() != SZ) [[unlikely]]
                throw error(fmt::format("expected {} bytes but got {}", SZ, bytes.size()));
            std::copy(bytes.begin(), bytes.end(), this->begin());
        }

        byte_array(const buffer bytes)
        {
            if (bytes.size() != SZ) [[unlikely]]
                throw error(fmt::format("expected {} bytes but got {}", SZ, bytes.size()));
            std::copy(bytes.begin(), bytes.end(), this->begin());
        }

        operator buffer() const noexcept
        {
            return { this->data(), SZ };
        }
    };

    struct uint8_vector: std::vector<uint8_t> {
        using base_type = std::vector<uint8_t>;
        using base_type::base_type;

        static uint8_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0) [[unlikely]]
                throw error(fmt::format("a hex string must have an even number of digits: {}", hex));
            uint8_vector res(hex.size() / 2);
            decode_hex(res, hex);
            return res;
        }

        uint8_vector() = default;

        uint8_vector(const buffer bytes):
            base_type(bytes.begin(), bytes.end())
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        [[nodiscard]] std::string_view str() const noexcept
        {
            return static_cast<buffer>(*this);
        }

        std::strong_ordering operator<=>(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) <=> static_cast<buffer>(o);
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) == static_cast<buffer>(o);
        }

        bool operator==(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) == o;
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<epochwise::byte_array<SZ>>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<epochwise::buffer>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<epochwise::uint8_vector>: formatter<std::span<const uint8_t>> {
    };
}
