/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_COMMON_ERROR_HPP
#define NBNT_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nbnt {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    protected:
        struct quick_tag {};

        // neither copies the message nor captures a stacktrace; msg must have static storage duration
        explicit base_error(quick_tag, const char *msg) noexcept;
    private:
        std::string _msg {};
        const char *_static_msg = nullptr;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    protected:
        explicit error(quick_tag, const char *msg) noexcept;
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !NBNT_COMMON_ERROR_HPP
