/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/nbt/errors.hpp>
#include <nbnt/nbt/limiter.hpp>

namespace nbnt::nbt {
    limiter limiter::unlimited(const policy &p)
    {
        return limiter { unlimited_tag {}, p };
    }

    limiter limiter::reference_protocol(const policy &p)
    {
        return limiter { reference_max_length, reference_max_depth, p };
    }

    limiter::limiter(const uint64_t max_length, const size_t max_depth, const policy &p):
        _max_length { max_length }, _max_depth { max_depth }, _policy { p }
    {
    }

    limiter::limiter(unlimited_tag, const policy &p):
        _max_length { std::numeric_limits<uint64_t>::max() },
        _max_depth { std::numeric_limits<size_t>::max() },
        _policy { p }, _unlimited { true }
    {
    }

    // negative lengths and counter overflows are never raised as quick errors
    void limiter::_throw_negative_length(const int64_t bytes) const
    {
        throw negative_length_error { bytes };
    }

    void limiter::_throw_counter_overflow(const uint64_t bytes) const
    {
        throw counter_overflow_error { _length, bytes };
    }

    void limiter::_throw_length(const uint64_t new_length) const
    {
        raise<length_error>(_policy.quick_errors, new_length, _max_length);
    }

    void limiter::_throw_depth_overflow() const
    {
        raise<depth_overflow_error>(_policy.quick_errors, _max_depth);
    }

    void limiter::_throw_depth_underflow() const
    {
        raise<depth_underflow_error>(_policy.quick_errors, _depth);
    }
}
