/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_NBT_LIMITER_HPP
#define NBNT_NBT_LIMITER_HPP

#include <cstdint>
#include <limits>
#include <nbnt/common/format.hpp>

namespace nbnt::nbt {
    struct limiter_policy {
        // unnamed reads require a zero-length name
        bool strict_empty_names = false;
        // when disabled, long arrays are rejected as an unknown type
        bool allow_long_arrays = true;
        // throw preallocated errors without a stacktrace
        bool quick_errors = false;

        bool operator==(const limiter_policy &) const =default;
    };

    /*
     * Bounds the number of bytes consumed and the nesting depth of a single decode.
     * An instance is single-owner state valid for one decode call tree; reset() allows reuse.
     * The unlimited variant ignores all accounting and reports zero length and depth.
     */
    struct limiter {
        using policy = limiter_policy;

        static constexpr uint64_t reference_max_length = 0x200000;
        static constexpr size_t reference_max_depth = 512;

        static limiter unlimited(const policy &p={});
        static limiter reference_protocol(const policy &p={});

        explicit limiter(uint64_t max_length, size_t max_depth, const policy &p={});

        void read_signed(const int64_t bytes)
        {
            if (bytes < 0) [[unlikely]]
                _throw_negative_length(bytes);
            read_unsigned(static_cast<uint64_t>(bytes));
        }

        void read_unsigned(const uint64_t bytes)
        {
            if (_unlimited)
                return;
            if (bytes > std::numeric_limits<uint64_t>::max() - _length) [[unlikely]]
                _throw_counter_overflow(bytes);
            const auto new_length = _length + bytes;
            if (new_length > _max_length) [[unlikely]]
                _throw_length(new_length);
            _length = new_length;
        }

        void push()
        {
            if (_unlimited)
                return;
            if (_depth >= _max_depth) [[unlikely]]
                _throw_depth_overflow();
            ++_depth;
        }

        void pop()
        {
            if (_unlimited)
                return;
            if (_depth == 0) [[unlikely]]
                _throw_depth_underflow();
            --_depth;
        }

        void reset() noexcept
        {
            _length = 0;
            _depth = 0;
        }

        uint64_t length() const noexcept
        {
            return _length;
        }

        size_t depth() const noexcept
        {
            return _depth;
        }

        uint64_t max_length() const noexcept
        {
            return _max_length;
        }

        size_t max_depth() const noexcept
        {
            return _max_depth;
        }

        bool is_unlimited() const noexcept
        {
            return _unlimited;
        }

        const policy &rules() const noexcept
        {
            return _policy;
        }

        bool strict_empty_names() const noexcept
        {
            return _policy.strict_empty_names;
        }

        bool allow_long_arrays() const noexcept
        {
            return _policy.allow_long_arrays;
        }

        bool quick_errors() const noexcept
        {
            return _policy.quick_errors;
        }
    private:
        struct unlimited_tag {};

        uint64_t _max_length;
        size_t _max_depth;
        policy _policy;
        bool _unlimited = false;
        uint64_t _length = 0;
        size_t _depth = 0;

        limiter(unlimited_tag, const policy &p);

        [[noreturn]] void _throw_negative_length(int64_t bytes) const;
        [[noreturn]] void _throw_counter_overflow(uint64_t bytes) const;
        [[noreturn]] void _throw_length(uint64_t new_length) const;
        [[noreturn]] void _throw_depth_overflow() const;
        [[noreturn]] void _throw_depth_underflow() const;
    };
}

namespace fmt {
    template<>
    struct formatter<nbnt::nbt::limiter>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v.is_unlimited())
                return fmt::format_to(ctx.out(), "limiter(unlimited)");
            return fmt::format_to(ctx.out(), "limiter(length: {}/{} depth: {}/{})",
                v.length(), v.max_length(), v.depth(), v.max_depth());
        }
    };
}

#endif // !NBNT_NBT_LIMITER_HPP
