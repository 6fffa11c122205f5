/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_NBT_ERRORS_HPP
#define NBNT_NBT_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <nbnt/common/error.hpp>
#include <nbnt/nbt/types.hpp>

namespace nbnt::nbt {
    /*
     * The classes with a quick() method can be thrown as copies of a preallocated instance
     * that carries a fixed message and no stacktrace. Both forms are caught by the same class.
     */

    struct negative_length_error: error {
        explicit negative_length_error(int64_t bytes);
    };

    struct counter_overflow_error: error {
        explicit counter_overflow_error(uint64_t length, uint64_t bytes);
    };

    struct limit_error: error {
        using error::error;
    protected:
        explicit limit_error(quick_tag tag, const char *msg) noexcept;
    };

    struct length_error: limit_error {
        explicit length_error(uint64_t length, uint64_t max_length);
        static const length_error &quick() noexcept;
    private:
        length_error() noexcept;
    };

    struct depth_overflow_error: limit_error {
        explicit depth_overflow_error(size_t max_depth);
        static const depth_overflow_error &quick() noexcept;
    private:
        depth_overflow_error() noexcept;
    };

    struct depth_underflow_error: limit_error {
        explicit depth_underflow_error(size_t depth);
        static const depth_underflow_error &quick() noexcept;
    private:
        depth_underflow_error() noexcept;
    };

    struct unknown_type_error: error {
        explicit unknown_type_error(uint8_t tag);
        static const unknown_type_error &quick() noexcept;
    private:
        unknown_type_error() noexcept;
    };

    struct malformed_error: error {
        using error::error;
    protected:
        explicit malformed_error(quick_tag tag, const char *msg) noexcept;
    };

    // a non-zero length paired with the end tag
    struct invalid_length_error: malformed_error {
        explicit invalid_length_error(tag_type type, int64_t length);
        static const invalid_length_error &quick() noexcept;
    private:
        invalid_length_error() noexcept;
    };

    struct non_empty_name_error: malformed_error {
        explicit non_empty_name_error(size_t length);
        static const non_empty_name_error &quick() noexcept;
    private:
        non_empty_name_error() noexcept;
    };

    struct null_in_list_error: error {
        explicit null_in_list_error(size_t index);
    };

    struct type_mismatch_error: error {
        explicit type_mismatch_error(tag_type expected, tag_type actual);
        using error::error;
    };

    // derives from std::runtime_error so that an exhausted input does not pay for a stacktrace
    struct incomplete_error: std::runtime_error {
        explicit incomplete_error(size_t requested, size_t available);
    };

    template<typename E, typename... Args>
    [[noreturn]] void raise(const bool quick, Args&&... args)
    {
        if constexpr (requires { E::quick(); }) {
            if (quick)
                throw E::quick();
        }
        throw E { std::forward<Args>(args)... };
    }
}

#endif // !NBNT_NBT_ERRORS_HPP
