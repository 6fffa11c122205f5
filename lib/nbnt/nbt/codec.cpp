/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <array>
#include <limits>
#include <nbnt/nbt/codec.hpp>
#include <nbnt/nbt/mutf8.hpp>

namespace nbnt::nbt {
    namespace {
        // caps the up-front reservation so that a claimed element count cannot allocate ahead of the input
        constexpr size_t max_reserve = 0x1000;

        std::optional<node> read_end(data_input &, limiter &)
        {
            return {};
        }

        std::optional<node> read_byte(data_input &in, limiter &lim)
        {
            lim.read_unsigned(sizeof(int8_t));
            return node { in.read_byte() };
        }

        std::optional<node> read_short(data_input &in, limiter &lim)
        {
            lim.read_unsigned(sizeof(int16_t));
            return node { in.read_short() };
        }

        std::optional<node> read_int(data_input &in, limiter &lim)
        {
            lim.read_unsigned(sizeof(int32_t));
            return node { in.read_int() };
        }

        std::optional<node> read_long(data_input &in, limiter &lim)
        {
            lim.read_unsigned(sizeof(int64_t));
            return node { in.read_long() };
        }

        std::optional<node> read_float(data_input &in, limiter &lim)
        {
            lim.read_unsigned(sizeof(float));
            return node { in.read_float() };
        }

        std::optional<node> read_double(data_input &in, limiter &lim)
        {
            lim.read_unsigned(sizeof(double));
            return node { in.read_double() };
        }

        // the element count is charged before any allocation
        template<typename T>
        std::vector<T> read_array(data_input &in, limiter &lim)
        {
            lim.read_unsigned(sizeof(int32_t));
            const auto len = in.read_int();
            if (len == 0)
                return {};
            lim.read_signed(static_cast<int64_t>(len) * static_cast<int64_t>(sizeof(T)));
            std::vector<T> res(static_cast<size_t>(len));
            in.read_fully(write_buffer { reinterpret_cast<uint8_t *>(res.data()), res.size() * sizeof(T) });
            if constexpr (sizeof(T) > 1) {
                for (auto &v: res)
                    v = net_to_host(v);
            }
            return res;
        }

        std::optional<node> read_byte_array(data_input &in, limiter &lim)
        {
            return node { read_array<int8_t>(in, lim) };
        }

        std::optional<node> read_int_array(data_input &in, limiter &lim)
        {
            return node { read_array<int32_t>(in, lim) };
        }

        std::optional<node> read_long_array(data_input &in, limiter &lim)
        {
            if (!lim.allow_long_arrays()) [[unlikely]]
                raise<unknown_type_error>(lim.quick_errors(), static_cast<uint8_t>(tag_type::long_array));
            return node { read_array<int64_t>(in, lim) };
        }

        std::optional<node> read_string_node(data_input &in, limiter &lim)
        {
            return node { read_string(in, lim) };
        }

        std::optional<node> read_list(data_input &in, limiter &lim)
        {
            lim.push();
            lim.read_unsigned(sizeof(uint8_t));
            const auto elem_tag = in.read_unsigned_byte();
            lim.read_unsigned(sizeof(int32_t));
            const auto count = in.read_int();
            if (elem_tag == static_cast<uint8_t>(tag_type::end)) {
                if (count != 0) [[unlikely]]
                    raise<invalid_length_error>(lim.quick_errors(), tag_type::end, count);
                lim.pop();
                return node { list {} };
            }
            if (count == 0) {
                lim.pop();
                return node { list {} };
            }
            if (count < 0) [[unlikely]]
                throw negative_length_error { count };
            const auto decoder = decoder_for(elem_tag, lim.quick_errors());
            list::storage_type items {};
            items.reserve(std::min(static_cast<size_t>(count), max_reserve));
            for (int32_t i = 0; i < count; ++i) {
                auto item = decoder(in, lim);
                if (!item) [[unlikely]]
                    throw null_in_list_error { static_cast<size_t>(i) };
                items.emplace_back(std::move(*item));
            }
            lim.pop();
            return node { list(std::move(items)) };
        }

        std::optional<node> read_compound(data_input &in, limiter &lim)
        {
            lim.push();
            compound res {};
            for (;;) {
                auto item = read_named(in, lim);
                if (!item)
                    break;
                res.put(std::move(item->first), std::move(item->second));
            }
            lim.pop();
            return node { std::move(res) };
        }

        constexpr std::array<read_func, max_tag + 1> decoders {
            read_end,
            read_byte,
            read_short,
            read_int,
            read_long,
            read_float,
            read_double,
            read_byte_array,
            read_string_node,
            read_list,
            read_compound,
            read_int_array,
            read_long_array
        };

        template<typename T>
        void write_array(data_output &out, const std::vector<T> &arr)
        {
            out.write_int(static_cast<int32_t>(arr.size()));
            if constexpr (sizeof(T) == 1) {
                out.write(buffer { reinterpret_cast<const uint8_t *>(arr.data()), arr.size() });
            } else {
                std::vector<T> net {};
                net.reserve(arr.size());
                for (const auto v: arr)
                    net.emplace_back(host_to_net(v));
                out.write(buffer { reinterpret_cast<const uint8_t *>(net.data()), net.size() * sizeof(T) });
            }
        }

        template<typename T>
        void check_array_size(const std::vector<T> &arr)
        {
            if (arr.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) [[unlikely]]
                throw error(fmt::format("an array of {} elements does not fit an int32 length", arr.size()));
        }

        void write_list(data_output &out, const list &l)
        {
            const auto elem_type = l.type();
            for (const auto &item: l) {
                if (item.type() != elem_type) [[unlikely]]
                    throw type_mismatch_error { elem_type, item.type() };
            }
            if (l.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) [[unlikely]]
                throw error(fmt::format("a list of {} elements does not fit an int32 length", l.size()));
            out.write_unsigned_byte(static_cast<uint8_t>(elem_type));
            out.write_int(static_cast<int32_t>(l.size()));
            for (const auto &item: l)
                write_payload(out, item);
        }

        void write_compound(data_output &out, const compound &c)
        {
            for (const auto &[name, item]: c)
                write_named(out, name, item);
            out.write_unsigned_byte(static_cast<uint8_t>(tag_type::end));
        }
    }

    tag_type type_of(const node *n) noexcept
    {
        return n ? n->type() : tag_type::end;
    }

    read_func decoder_for(const uint8_t tag, const bool quick_errors)
    {
        if (!is_known_tag(tag)) [[unlikely]]
            raise<unknown_type_error>(quick_errors, tag);
        return decoders[tag];
    }

    std::string read_string(data_input &in, limiter &lim)
    {
        lim.read_unsigned(sizeof(uint16_t));
        const size_t len = in.read_unsigned_short();
        lim.read_unsigned(len);
        if (len == 0)
            return {};
        uint8_vector bytes(len);
        in.read_fully(bytes);
        return mutf8::decode(bytes);
    }

    void write_string(data_output &out, const std::string_view s)
    {
        const auto bytes = mutf8::encode(s);
        if (bytes.size() > mutf8::max_encoded_size) [[unlikely]]
            throw error(fmt::format("an encoded string of {} bytes is longer than the maximum of {}", bytes.size(), mutf8::max_encoded_size));
        out.write_unsigned_short(static_cast<uint16_t>(bytes.size()));
        out.write(bytes);
    }

    std::optional<named_node> read_named(data_input &in, limiter &lim)
    {
        lim.read_unsigned(sizeof(uint8_t));
        const auto tag = in.read_unsigned_byte();
        if (tag == static_cast<uint8_t>(tag_type::end))
            return {};
        auto name = read_string(in, lim);
        auto val = decoder_for(tag, lim.quick_errors())(in, lim);
        return named_node { std::move(name), std::move(*val) };
    }

    std::optional<node> read_unnamed(data_input &in, limiter &lim)
    {
        lim.read_unsigned(sizeof(uint8_t));
        const auto tag = in.read_unsigned_byte();
        if (tag == static_cast<uint8_t>(tag_type::end))
            return {};
        lim.read_unsigned(sizeof(uint16_t));
        const size_t name_len = in.read_unsigned_short();
        if (name_len != 0 && lim.strict_empty_names()) [[unlikely]]
            raise<non_empty_name_error>(lim.quick_errors(), name_len);
        lim.read_unsigned(name_len);
        in.skip(name_len);
        return decoder_for(tag, lim.quick_errors())(in, lim);
    }

    std::optional<node> read(data_input &in, limiter &lim)
    {
        lim.read_unsigned(sizeof(uint8_t));
        const auto tag = in.read_unsigned_byte();
        if (tag == static_cast<uint8_t>(tag_type::end))
            return {};
        return decoder_for(tag, lim.quick_errors())(in, lim);
    }

    void write_payload(data_output &out, const node &n)
    {
        std::visit([&out](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, int8_t>) {
                out.write_byte(v);
            } else if constexpr (std::is_same_v<T, int16_t>) {
                out.write_short(v);
            } else if constexpr (std::is_same_v<T, int32_t>) {
                out.write_int(v);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                out.write_long(v);
            } else if constexpr (std::is_same_v<T, float>) {
                out.write_float(v);
            } else if constexpr (std::is_same_v<T, double>) {
                out.write_double(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_string(out, v);
            } else if constexpr (std::is_same_v<T, list>) {
                write_list(out, v);
            } else if constexpr (std::is_same_v<T, compound>) {
                write_compound(out, v);
            } else {
                check_array_size(v);
                write_array(out, v);
            }
        }, n.value());
    }

    void write_named(data_output &out, const std::string_view name, const node *n)
    {
        out.write_unsigned_byte(static_cast<uint8_t>(type_of(n)));
        if (!n)
            return;
        write_string(out, name);
        write_payload(out, *n);
    }

    void write_unnamed(data_output &out, const node *n)
    {
        out.write_unsigned_byte(static_cast<uint8_t>(type_of(n)));
        if (!n)
            return;
        out.write_unsigned_short(0);
        write_payload(out, *n);
    }

    void write(data_output &out, const node *n)
    {
        out.write_unsigned_byte(static_cast<uint8_t>(type_of(n)));
        if (n)
            write_payload(out, *n);
    }

    uint8_vector encode(const node &n, const framing f, const std::string_view name)
    {
        vector_output out {};
        switch (f) {
            case framing::named:
                write_named(out, name, n);
                break;
            case framing::unnamed:
                write_unnamed(out, n);
                break;
            case framing::plain:
                write(out, n);
                break;
            default:
                throw error(fmt::format("unsupported framing: {}", static_cast<int>(f)));
        }
        return out.take();
    }

    std::optional<named_node> decode(data_input &in, limiter &lim, const framing f)
    {
        switch (f) {
            case framing::named:
                return read_named(in, lim);
            case framing::unnamed:
                if (auto n = read_unnamed(in, lim); n)
                    return named_node { std::string {}, std::move(*n) };
                return {};
            case framing::plain:
                if (auto n = read(in, lim); n)
                    return named_node { std::string {}, std::move(*n) };
                return {};
            default:
                throw error(fmt::format("unsupported framing: {}", static_cast<int>(f)));
        }
    }

    std::optional<named_node> decode(const buffer bytes, limiter &lim, const framing f)
    {
        buffer_input in { bytes };
        return decode(in, lim, f);
    }
}
