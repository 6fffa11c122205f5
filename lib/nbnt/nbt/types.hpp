/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_NBT_TYPES_HPP
#define NBNT_NBT_TYPES_HPP

#include <cstdint>
#include <string_view>
#include <nbnt/common/format.hpp>

namespace nbnt::nbt {
    enum class tag_type: uint8_t {
        end = 0,
        byte = 1,
        short_ = 2,
        int_ = 3,
        long_ = 4,
        float_ = 5,
        double_ = 6,
        byte_array = 7,
        string = 8,
        list = 9,
        compound = 10,
        int_array = 11,
        long_array = 12
    };

    static constexpr uint8_t max_tag = static_cast<uint8_t>(tag_type::long_array);

    constexpr bool is_known_tag(const uint8_t tag) noexcept
    {
        return tag <= max_tag;
    }

    constexpr std::string_view tag_name(const tag_type t) noexcept
    {
        switch (t) {
            case tag_type::end: return "end";
            case tag_type::byte: return "byte";
            case tag_type::short_: return "short";
            case tag_type::int_: return "int";
            case tag_type::long_: return "long";
            case tag_type::float_: return "float";
            case tag_type::double_: return "double";
            case tag_type::byte_array: return "byte_array";
            case tag_type::string: return "string";
            case tag_type::list: return "list";
            case tag_type::compound: return "compound";
            case tag_type::int_array: return "int_array";
            case tag_type::long_array: return "long_array";
            default: return "unknown";
        }
    }
}

namespace fmt {
    template<>
    struct formatter<nbnt::nbt::tag_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            const auto name = nbnt::nbt::tag_name(v);
            if (name == "unknown")
                return fmt::format_to(ctx.out(), "tag_type: {}", static_cast<int>(v));
            return fmt::format_to(ctx.out(), "{}", name);
        }
    };
}

#endif // !NBNT_NBT_TYPES_HPP
