/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/logger.hpp>
#include <nbnt/nbt/limiter-config.hpp>

namespace nbnt::nbt {
    namespace {
        bool get_bool(const std::string_view key, const json::value &v)
        {
            if (!v.is_bool()) [[unlikely]]
                throw error(fmt::format("limiter profile key {} must be a boolean but got {}", key, json::serialize(v)));
            return v.get_bool();
        }

        template<typename T>
        T get_uint(const std::string_view key, const json::value &v)
        {
            if (!v.is_number()) [[unlikely]]
                throw error(fmt::format("limiter profile key {} must be a number but got {}", key, json::serialize(v)));
            try {
                return v.to_number<T>();
            } catch (const std::exception &ex) {
                throw error(fmt::format("limiter profile key {} has an unsupported value {}", key, json::serialize(v)), ex);
            }
        }
    }

    limiter_profile limiter_profile::from_json(const json::object &j)
    {
        limiter_profile p {};
        for (const auto &[key, val]: j) {
            if (key == "unlimited")
                p.unlimited = get_bool(key, val);
            else if (key == "max_length")
                p.max_length = get_uint<uint64_t>(key, val);
            else if (key == "max_depth")
                p.max_depth = get_uint<size_t>(key, val);
            else if (key == "strict_empty_names")
                p.rules.strict_empty_names = get_bool(key, val);
            else if (key == "allow_long_arrays")
                p.rules.allow_long_arrays = get_bool(key, val);
            else if (key == "quick_errors")
                p.rules.quick_errors = get_bool(key, val);
            else
                throw error(fmt::format("unsupported limiter profile key: {}", static_cast<std::string_view>(key)));
        }
        return p;
    }

    limiter limiter_profile::make() const
    {
        if (unlimited)
            return limiter::unlimited(rules);
        return limiter { max_length, max_depth, rules };
    }

    limiter_profiles::limiter_profiles()
    {
        _profiles.emplace(unlimited_name, limiter_profile { .unlimited=true });
        _profiles.emplace(reference_name, limiter_profile {});
    }

    limiter_profiles::limiter_profiles(const config &cfg):
        limiter_profiles {}
    {
        for (const auto &[name, val]: cfg.json()) {
            if (!val.is_object()) [[unlikely]]
                throw error(fmt::format("limiter profile {} must be a json object", static_cast<std::string_view>(name)));
            try {
                _profiles.insert_or_assign(std::string { name }, limiter_profile::from_json(val.get_object()));
            } catch (const error &ex) {
                throw error(fmt::format("invalid limiter profile {}", static_cast<std::string_view>(name)), ex);
            }
            logger::debug("configured limiter profile {}", static_cast<std::string_view>(name));
        }
    }

    const limiter_profile &limiter_profiles::at(const std::string_view name) const
    {
        if (const auto it = _profiles.find(name); it != _profiles.end()) [[likely]]
            return it->second;
        throw error(fmt::format("unknown limiter profile: {}; known profiles: {}", name, names()));
    }

    limiter limiter_profiles::make(const std::string_view name) const
    {
        return at(name).make();
    }

    std::vector<std::string> limiter_profiles::names() const
    {
        std::vector<std::string> res {};
        res.reserve(_profiles.size());
        for (const auto &[name, p]: _profiles)
            res.emplace_back(name);
        return res;
    }
}
