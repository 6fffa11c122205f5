/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdio>
#include <memory>
#include "file.hpp"

namespace nbnt::file {
    struct file_deleter {
        void operator()(std::FILE *f) const noexcept
        {
            std::fclose(f);
        }
    };
    using file_ptr = std::unique_ptr<std::FILE, file_deleter>;

    void read(const std::string &path, uint8_vector &buf)
    {
        file_ptr f { std::fopen(path.c_str(), "rb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file for reading: {}", path));
        const auto sz = std::filesystem::file_size(path);
        buf.resize(sz);
        if (sz && std::fread(buf.data(), 1, sz, f.get()) != sz) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
    }

    void write(const std::string &path, const buffer &buf)
    {
        file_ptr f { std::fopen(path.c_str(), "wb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file for writing: {}", path));
        if (!buf.empty() && std::fwrite(buf.data(), 1, buf.size(), f.get()) != buf.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", buf.size(), path));
        if (std::fflush(f.get()) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to flush {}", path));
    }
}
