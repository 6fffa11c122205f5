/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_CLI_COMMON_HPP
#define NBNT_CLI_COMMON_HPP

#include <nbnt/cli.hpp>
#include <nbnt/nbt/codec.hpp>
#include <nbnt/nbt/limiter-config.hpp>

namespace nbnt::cli {
    inline std::optional<nbt::framing> parse_framing(const std::string_view s)
    {
        if (s == "named")
            return nbt::framing::named;
        if (s == "unnamed")
            return nbt::framing::unnamed;
        if (s == "plain")
            return nbt::framing::plain;
        return {};
    }

    inline std::optional<std::string> validate_framing(const std::optional<std::string> &val)
    {
        if (!val)
            return "a value is required";
        if (!parse_framing(*val))
            return "must be one of: named, unnamed, plain";
        return {};
    }

    inline const std::string &option_value(const options &opts, const std::string &name)
    {
        const auto it = opts.find(name);
        if (it == opts.end() || !it->second) [[unlikely]]
            throw error(fmt::format("option '--{}' requires a value", name));
        return *it->second;
    }

    inline nbt::framing framing_option(const options &opts, const std::string &name)
    {
        const auto &val = option_value(opts, name);
        if (const auto f = parse_framing(val); f) [[likely]]
            return *f;
        throw error(fmt::format("unsupported framing: {}", val));
    }

    // the options shared by all commands that decode tag files
    inline void add_decode_options(config &cmd)
    {
        cmd.opts.emplace("framing", option_config { "the framing of the input: named, unnamed or plain", "named", validate_framing });
        cmd.opts.emplace("profile", option_config { "the name of the limiter profile", std::string { nbt::limiter_profiles::reference_name } });
        cmd.opts.emplace("limits", option_config { "a json file with additional limiter profiles" });
    }

    inline nbt::limiter make_limiter(const options &opts)
    {
        const auto &profile = option_value(opts, "profile");
        const auto limits_it = opts.find("limits");
        const auto profiles = limits_it != opts.end() && limits_it->second
            ? nbt::limiter_profiles { config_file { *limits_it->second } }
            : nbt::limiter_profiles {};
        auto lim = profiles.make(profile);
        logger::debug("limiter profile {}: {}", profile, lim);
        return lim;
    }
}

#endif // !NBNT_CLI_COMMON_HPP
