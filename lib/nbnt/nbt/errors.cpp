/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/nbt/errors.hpp>

namespace nbnt::nbt {
    negative_length_error::negative_length_error(const int64_t bytes):
        error { fmt::format("Negative bytes read. ({})", bytes) }
    {
    }

    counter_overflow_error::counter_overflow_error(const uint64_t length, const uint64_t bytes):
        error { fmt::format("NBT length counter overflow. ({} + {})", length, bytes) }
    {
    }

    limit_error::limit_error(quick_tag tag, const char *msg) noexcept:
        error { tag, msg }
    {
    }

    length_error::length_error(const uint64_t length, const uint64_t max_length):
        limit_error { fmt::format("Max NBT length reached. ({} > {})", length, max_length) }
    {
    }

    length_error::length_error() noexcept:
        limit_error { quick_tag {}, "Max NBT length reached." }
    {
    }

    const length_error &length_error::quick() noexcept
    {
        static const length_error instance {};
        return instance;
    }

    depth_overflow_error::depth_overflow_error(const size_t max_depth):
        limit_error { fmt::format("Max NBT depth reached. ({} > {})", max_depth + 1, max_depth) }
    {
    }

    depth_overflow_error::depth_overflow_error() noexcept:
        limit_error { quick_tag {}, "Max NBT depth reached." }
    {
    }

    const depth_overflow_error &depth_overflow_error::quick() noexcept
    {
        static const depth_overflow_error instance {};
        return instance;
    }

    depth_underflow_error::depth_underflow_error(const size_t depth):
        limit_error { fmt::format("Min NBT depth reached. ({} < 0)", static_cast<int64_t>(depth) - 1) }
    {
    }

    depth_underflow_error::depth_underflow_error() noexcept:
        limit_error { quick_tag {}, "Min NBT depth reached." }
    {
    }

    const depth_underflow_error &depth_underflow_error::quick() noexcept
    {
        static const depth_underflow_error instance {};
        return instance;
    }

    unknown_type_error::unknown_type_error(const uint8_t tag):
        error { fmt::format("Unknown NBT type. ({})", tag) }
    {
    }

    unknown_type_error::unknown_type_error() noexcept:
        error { quick_tag {}, "Unknown NBT type." }
    {
    }

    const unknown_type_error &unknown_type_error::quick() noexcept
    {
        static const unknown_type_error instance {};
        return instance;
    }

    malformed_error::malformed_error(quick_tag tag, const char *msg) noexcept:
        error { tag, msg }
    {
    }

    invalid_length_error::invalid_length_error(const tag_type type, const int64_t length):
        malformed_error { fmt::format("Invalid NBT length. (type: {}; length: {})", type, length) }
    {
    }

    invalid_length_error::invalid_length_error() noexcept:
        malformed_error { quick_tag {}, "Invalid NBT length." }
    {
    }

    const invalid_length_error &invalid_length_error::quick() noexcept
    {
        static const invalid_length_error instance {};
        return instance;
    }

    non_empty_name_error::non_empty_name_error(const size_t length):
        malformed_error { fmt::format("Non-empty name in an unnamed NBT. ({})", length) }
    {
    }

    non_empty_name_error::non_empty_name_error() noexcept:
        malformed_error { quick_tag {}, "Non-empty name in an unnamed NBT." }
    {
    }

    const non_empty_name_error &non_empty_name_error::quick() noexcept
    {
        static const non_empty_name_error instance {};
        return instance;
    }

    null_in_list_error::null_in_list_error(const size_t index):
        error { fmt::format("Null NBT in list at index {}", index) }
    {
    }

    type_mismatch_error::type_mismatch_error(const tag_type expected, const tag_type actual):
        error { fmt::format("Invalid NBT type: expected {} but got {}", expected, actual) }
    {
    }

    incomplete_error::incomplete_error(const size_t requested, const size_t available):
        std::runtime_error { fmt::format("unexpected end of input: requested {} bytes but only {} are available", requested, available) }
    {
    }
}
