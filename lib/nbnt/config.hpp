/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_CONFIG_HPP
#define NBNT_CONFIG_HPP

#include <string>
#include <string_view>
#include <nbnt/common/file.hpp>
#include <nbnt/json.hpp>

namespace nbnt {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }

        [[nodiscard]] buffer bytes() const
        {
            return _bytes_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
        virtual buffer _bytes_impl() const =0;
    };

    // an in-memory config for tests and built-in defaults
    struct config_json: config {
        explicit config_json(json::object &&j);
    private:
        const json::object _json;
        const std::string _bytes;

        const json::value &_at_impl(const std::string_view &name) const override;

        const json::object &_json_impl() const override
        {
            return _json;
        }

        buffer _bytes_impl() const override
        {
            return _bytes;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        std::string _path;
        uint8_vector _raw;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;

        const json::object &_json_impl() const override
        {
            return _parsed;
        }

        buffer _bytes_impl() const override
        {
            return _raw;
        }
    };
}

#endif // !NBNT_CONFIG_HPP
