/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstring>
#include <nbnt/nbt/errors.hpp>
#include <nbnt/nbt/io.hpp>

namespace nbnt::nbt {
    void buffer_input::_read_impl(const write_buffer out)
    {
        if (out.size() > remaining()) [[unlikely]]
            throw incomplete_error { out.size(), remaining() };
        memcpy(out.data(), _bytes.data() + _offset, out.size());
        _offset += out.size();
    }

    void buffer_input::_skip_impl(const size_t num_bytes)
    {
        if (num_bytes > remaining()) [[unlikely]]
            throw incomplete_error { num_bytes, remaining() };
        _offset += num_bytes;
    }

    void stream_input::_read_impl(const write_buffer out)
    {
        _is.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(out.size()));
        if (const auto got = static_cast<size_t>(_is.gcount()); got != out.size()) [[unlikely]]
            throw incomplete_error { out.size(), got };
    }

    void stream_input::_skip_impl(const size_t num_bytes)
    {
        _is.ignore(static_cast<std::streamsize>(num_bytes));
        if (const auto got = static_cast<size_t>(_is.gcount()); got != num_bytes) [[unlikely]]
            throw incomplete_error { num_bytes, got };
    }

    void stream_output::_write_impl(const buffer bytes)
    {
        _os.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!_os) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to an output stream", bytes.size()));
    }
}
