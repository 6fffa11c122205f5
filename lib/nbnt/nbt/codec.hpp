/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_NBT_CODEC_HPP
#define NBNT_NBT_CODEC_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <nbnt/nbt/io.hpp>
#include <nbnt/nbt/limiter.hpp>
#include <nbnt/nbt/node.hpp>

namespace nbnt::nbt {
    // an empty optional stands for the end tag
    using read_func = std::optional<node> (*)(data_input &, limiter &);
    using named_node = std::pair<std::string, node>;

    enum class framing {
        named, unnamed, plain
    };

    extern tag_type type_of(const node *n) noexcept;

    inline tag_type type_of(const node &n) noexcept
    {
        return n.type();
    }

    // throws unknown_type_error for tags outside of the known range
    extern read_func decoder_for(uint8_t tag, bool quick_errors=false);

    // a length-prefixed modified utf8 string with both the prefix and the payload charged to the limiter
    extern std::string read_string(data_input &in, limiter &lim);
    extern void write_string(data_output &out, std::string_view s);

    /*
     * Every top-level read charges the tag to the limiter and returns an empty optional
     * when the tag is the end tag.
     */
    extern std::optional<named_node> read_named(data_input &in, limiter &lim);
    extern std::optional<node> read_unnamed(data_input &in, limiter &lim);
    extern std::optional<node> read(data_input &in, limiter &lim);

    // the payload only, with no tag
    extern void write_payload(data_output &out, const node &n);

    // a null node is written as a single end tag
    extern void write_named(data_output &out, std::string_view name, const node *n);
    extern void write_unnamed(data_output &out, const node *n);
    extern void write(data_output &out, const node *n);

    inline void write_named(data_output &out, const std::string_view name, const node &n)
    {
        write_named(out, name, &n);
    }

    inline void write_unnamed(data_output &out, const node &n)
    {
        write_unnamed(out, &n);
    }

    inline void write(data_output &out, const node &n)
    {
        write(out, &n);
    }

    extern uint8_vector encode(const node &n, framing f=framing::named, std::string_view name={});
    // the name is empty unless the named framing is used
    extern std::optional<named_node> decode(data_input &in, limiter &lim, framing f=framing::named);
    extern std::optional<named_node> decode(buffer bytes, limiter &lim, framing f=framing::named);
}

namespace fmt {
    template<>
    struct formatter<nbnt::nbt::framing>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using nbnt::nbt::framing;
            switch (v) {
                case framing::named: return fmt::format_to(ctx.out(), "named");
                case framing::unnamed: return fmt::format_to(ctx.out(), "unnamed");
                case framing::plain: return fmt::format_to(ctx.out(), "plain");
                default: throw nbnt::error(fmt::format("unsupported framing: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !NBNT_NBT_CODEC_HPP
