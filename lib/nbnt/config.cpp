/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/config.hpp>
#include <nbnt/logger.hpp>

namespace nbnt {
    config_json::config_json(json::object &&j):
        _json { std::move(j) }, _bytes { json::serialize(_json) }
    {
    }

    const json::value &config_json::_at_impl(const std::string_view &name) const
    {
        const auto it = _json.find(name);
        if (it == _json.end()) [[unlikely]]
            throw error(fmt::format("config does not have the requested element {}", name));
        return it->value();
    }

    static json::object parse_object(const std::string &path, const buffer raw)
    {
        auto j = json::parse(raw);
        if (!j.is_object()) [[unlikely]]
            throw error(fmt::format("configuration file {} must contain a json object", path));
        return std::move(j.as_object());
    }

    config_file::config_file(const std::string &path):
        _path { path }, _raw { file::read(path) }, _parsed { parse_object(_path, _raw) }
    {
        logger::debug("loaded configuration file {} with {} elements", _path, _parsed.size());
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end()) [[unlikely]]
            throw error(fmt::format("configuration file {} does not have the element {}", _path, name));
        return it->value();
    }
}
