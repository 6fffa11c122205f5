/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_COMMON_FILE_HPP
#define NBNT_COMMON_FILE_HPP

#include <filesystem>
#include <string>
#include "bytes.hpp"

namespace nbnt::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern void write(const std::string &path, const buffer &buf);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    // removes the file at destruction
    struct tmp {
        explicit tmp(const std::string &name):
            _path { (std::filesystem::temp_directory_path() / name).string() }
        {
            std::filesystem::remove(_path);
        }

        tmp(const tmp &) =delete;

        ~tmp()
        {
            std::error_code ec {};
            std::filesystem::remove(_path, ec);
        }

        const std::string &path() const noexcept
        {
            return _path;
        }

        operator const std::string &() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !NBNT_COMMON_FILE_HPP
