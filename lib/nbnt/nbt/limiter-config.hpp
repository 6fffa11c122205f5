/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_NBT_LIMITER_CONFIG_HPP
#define NBNT_NBT_LIMITER_CONFIG_HPP

#include <map>
#include <string>
#include <vector>
#include <nbnt/config.hpp>
#include <nbnt/nbt/limiter.hpp>

namespace nbnt::nbt {
    struct limiter_profile {
        bool unlimited = false;
        uint64_t max_length = limiter::reference_max_length;
        size_t max_depth = limiter::reference_max_depth;
        limiter::policy rules {};

        // keys: unlimited, max_length, max_depth, strict_empty_names, allow_long_arrays, quick_errors
        static limiter_profile from_json(const json::object &j);

        limiter make() const;
        bool operator==(const limiter_profile &o) const =default;
    };

    /*
     * Named limiter profiles: the built-in "unlimited" and "reference-protocol"
     * plus any profiles defined by a configuration whose top-level keys are profile names.
     */
    struct limiter_profiles {
        static constexpr std::string_view unlimited_name = "unlimited";
        static constexpr std::string_view reference_name = "reference-protocol";

        limiter_profiles();
        explicit limiter_profiles(const config &cfg);

        const limiter_profile &at(std::string_view name) const;
        limiter make(std::string_view name) const;
        std::vector<std::string> names() const;
    private:
        std::map<std::string, limiter_profile, std::less<>> _profiles {};
    };
}

#endif // !NBNT_NBT_LIMITER_CONFIG_HPP
