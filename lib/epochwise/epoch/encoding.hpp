#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <bit>
#include <concepts>
#include <cstdint>
#include <limits>
#include <span>
#include <typeinfo>
#include <epochwise/codec/serializable.hpp>
#include <epochwise/common/bytes.hpp>

namespace epochwise::epoch {
    struct encoder;
    struct decoder;

    template<typename T>
    concept to_bytes_c = requires(const T t, encoder &enc)
    {
        t.to_bytes(enc);
    };

    template<typename T>
    concept from_bytes_c = requires(decoder &dec)
    {
        { T::from_bytes(dec) } -> std::same_as<T>;
    };

    // Integers are little-endian. Sizes and counts use a prefix-length encoding:
    // the number of leading one bits of the first byte gives the number of bytes that follow.
    struct encoder: codec::archive_t {
        template<std::unsigned_integral T>
        void uint_fixed(T val)
        {
            for (size_t i = 0; i < sizeof(T); ++i) {
                _bytes.emplace_back(static_cast<uint8_t>(val & 0xFF));
                if constexpr (sizeof(T) > 1)
                    val >>= 8;
            }
        }

        void uint_varlen(const uint64_t x)
        {
            size_t extra = 0;
            while (extra < 8 && x >= uint64_t { 1 } << (7 * (extra + 1)))
                ++extra;
            if (extra == 8) {
                _bytes.emplace_back(0xFF);
                uint_fixed(x);
                return;
            }
            _bytes.emplace_back(static_cast<uint8_t>(0xFF00U >> extra) | static_cast<uint8_t>(x >> (8 * extra)));
            for (size_t i = 0; i < extra; ++i)
                _bytes.emplace_back(static_cast<uint8_t>(x >> (8 * i)));
        }

        template<typename T>
        void process(const T &val)
        {
            if constexpr (to_bytes_c<T>) {
                val.to_bytes(*this);
            } else if constexpr (codec::serializable_c<T>) {
                // serialize only reads when given an encoder
                const_cast<T &>(val).serialize(*this);
            } else if constexpr (std::is_same_v<T, bool>) {
                _bytes.emplace_back(static_cast<uint8_t>(val));
            } else if constexpr (std::unsigned_integral<T>) {
                uint_fixed(val);
            } else {
                throw error(fmt::format("binary serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view, const T &val)
        {
            process(val);
        }

        void process_array(const auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            if (self.size() < min_sz || self.size() > max_sz) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", self.size(), min_sz, max_sz));
            uint_varlen(self.size());
            for (const auto &v: self)
                process(v);
        }

        // map_t iterates in key order, so equal maps always produce equal bytes
        void process_map(const auto &m, const std::string_view, const std::string_view)
        {
            uint_varlen(m.size());
            for (const auto &[k, v]: m) {
                process(k);
                process(v);
            }
        }

        void process_bytes_fixed(const buffer bytes)
        {
            _bytes.insert(_bytes.end(), bytes.begin(), bytes.end());
        }

        uint8_vector &bytes()
        {
            return _bytes;
        }

        const uint8_vector &bytes() const
        {
            return _bytes;
        }
    private:
        uint8_vector _bytes {};
    };

    struct decoder: codec::archive_t {
        explicit decoder(const buffer bytes) noexcept:
            _ptr { bytes.data() },
            _end { bytes.data() + bytes.size() }
        {
        }

        template<std::unsigned_integral T>
        T uint_fixed()
        {
            const auto bytes = next_bytes(sizeof(T));
            T x = 0;
            for (size_t i = sizeof(T); i > 0; --i) {
                if constexpr (sizeof(T) > 1)
                    x <<= 8;
                x |= bytes[i - 1];
            }
            return x;
        }

        // Only the shortest form of a value is accepted
        template<typename T=uint64_t>
        T uint_varlen()
        {
            const auto prefix = next();
            const auto extra = static_cast<size_t>(std::countl_one(prefix));
            if (extra == 8) {
                const auto x = uint_fixed<uint64_t>();
                if (x < uint64_t { 1 } << 56) [[unlikely]]
                    throw error(fmt::format("a non-canonical encoding of a variable-length integer {}", x));
                return _narrow<T>(x);
            }
            uint64_t x = static_cast<uint64_t>(prefix & (0x7FU >> extra)) << (8 * extra);
            const auto low = next_bytes(extra);
            for (size_t i = 0; i < extra; ++i)
                x |= static_cast<uint64_t>(low[i]) << (8 * i);
            if (extra > 0 && x < uint64_t { 1 } << (7 * extra)) [[unlikely]]
                throw error(fmt::format("a non-canonical encoding of a variable-length integer {}", x));
            return _narrow<T>(x);
        }

        template<typename T>
        void process(T &val)
        {
            if constexpr (from_bytes_c<T>) {
                val = T::from_bytes(*this);
            } else if constexpr (codec::serializable_c<T>) {
                val.serialize(*this);
            } else if constexpr (std::is_same_v<T, bool>) {
                switch (const auto b = next(); b) {
                    case 0: val = false; break;
                    case 1: val = true; break;
                    [[unlikely]] default: throw error(fmt::format("an invalid boolean value: {}", b));
                }
            } else if constexpr (std::unsigned_integral<T>) {
                val = uint_fixed<T>();
            } else {
                throw error(fmt::format("binary serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view, T &val)
        {
            process(val);
        }

        void process_array(auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            using T = std::decay_t<decltype(self)>;
            const auto sz = uint_varlen<size_t>();
            if (sz < min_sz || sz > max_sz) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", sz, min_sz, max_sz));
            // every element takes at least one byte
            if (sz > size()) [[unlikely]]
                throw error(fmt::format("array size {} exceeds the remaining {} bytes", sz, size()));
            self.clear();
            self.reserve(sz);
            for (size_t i = 0; i < sz; ++i) {
                typename T::value_type v {};
                process(v);
                self.emplace_back(std::move(v));
            }
        }

        // Keys must be unique and strictly ascending
        void process_map(auto &m, const std::string_view, const std::string_view)
        {
            using T = std::decay_t<decltype(m)>;
            const auto sz = uint_varlen<size_t>();
            m.clear();
            for (size_t i = 0; i < sz; ++i) {
                typename T::key_type k {};
                process(k);
                typename T::mapped_type v {};
                process(v);
                if (!m.empty() && !(m.rbegin()->first < k)) [[unlikely]]
                    throw error(fmt::format("a map's keys are not unique or not sorted at item #{}", i));
                m.emplace_hint(m.end(), std::move(k), std::move(v));
            }
        }

        void process_bytes_fixed(const std::span<uint8_t> bytes)
        {
            const auto data = next_bytes(bytes.size());
            std::copy(data.begin(), data.end(), bytes.begin());
        }

        [[nodiscard]] uint8_t next()
        {
            if (_ptr >= _end) [[unlikely]]
                throw error("an attempt to read past the end of the byte stream");
            return *_ptr++;
        }

        [[nodiscard]] buffer next_bytes(const size_t sz)
        {
            if (sz > size()) [[unlikely]]
                throw error(fmt::format("an attempt to read {} bytes with only {} left", sz, size()));
            const auto *begin = _ptr;
            _ptr += sz;
            return { begin, sz };
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return _ptr >= _end;
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return static_cast<size_t>(_end - _ptr);
        }
    private:
        const uint8_t *_ptr, *_end;

        template<std::unsigned_integral T>
        static T _narrow(const uint64_t x)
        {
            if (x > std::numeric_limits<T>::max()) [[unlikely]]
                throw error(fmt::format("a variable-length integer {} does not fit into {} bytes", x, sizeof(T)));
            return static_cast<T>(x);
        }
    };

    template<typename T>
    T from_bytes(const buffer bytes)
    {
        decoder dec { bytes };
        T res {};
        dec.process(res);
        if (!dec.empty()) [[unlikely]]
            throw error(fmt::format("{} trailing bytes after a serialized {}", dec.size(), typeid(T).name()));
        return res;
    }

    template<typename T>
    uint8_vector to_bytes(const T &val)
    {
        encoder enc {};
        enc.process(val);
        return std::move(enc.bytes());
    }
}
