/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_NBT_NODE_HPP
#define NBNT_NBT_NODE_HPP

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <nbnt/nbt/errors.hpp>
#include <nbnt/nbt/types.hpp>

namespace nbnt::nbt {
    struct node;

    using byte_array = std::vector<int8_t>;
    using int_array = std::vector<int32_t>;
    using long_array = std::vector<int64_t>;

    /*
     * An ordered sequence whose elements share a single node type.
     * The first element fixes the type; every mutation is validated against it.
     * Elements are only reachable as const references, set() is the way to replace one.
     */
    struct list {
        using storage_type = std::vector<node>;
        using const_iterator = storage_type::const_iterator;

        list();
        list(std::initializer_list<node> items);
        explicit list(storage_type items);
        list(const list &o);
        list(list &&o) noexcept;
        ~list();

        list &operator=(const list &o);
        list &operator=(list &&o) noexcept;

        // end for an empty list
        tag_type type() const noexcept;
        // throws type_mismatch_error if the node cannot be stored in this list
        void validate_type(const node &n) const;

        size_t size() const noexcept;
        bool empty() const noexcept;
        const node &at(size_t idx) const;
        const node &operator[](size_t idx) const;
        const_iterator begin() const noexcept;
        const_iterator end() const noexcept;
        const storage_type &items() const noexcept;

        void add(node n);
        void insert(size_t idx, node n);
        void add_all(storage_type items);
        // returns the replaced element
        node set(size_t idx, node n);
        // returns the removed element
        node erase(size_t idx);
        // removes the first equal element
        bool remove(const node &n);
        bool contains(const node &n) const;
        std::optional<size_t> index_of(const node &n) const;
        void clear() noexcept;

        bool operator==(const list &o) const;
    private:
        storage_type _items;

        void _check_index(size_t idx, size_t max_idx) const;
        void _validate_homogeneous(const storage_type &items) const;
    };

    /*
     * A keyed collection preserving the insertion order of its entries.
     * Re-putting a key replaces the value in place.
     * Equality ignores the order of the entries.
     */
    struct compound {
        using entry = std::pair<std::string, node>;
        using storage_type = std::vector<entry>;
        using const_iterator = storage_type::const_iterator;

        compound();
        compound(std::initializer_list<entry> entries);
        explicit compound(storage_type entries);
        compound(const compound &o);
        compound(compound &&o) noexcept;
        ~compound();

        compound &operator=(const compound &o);
        compound &operator=(compound &&o) noexcept;

        size_t size() const noexcept;
        bool empty() const noexcept;
        bool contains(std::string_view key) const noexcept;
        const node *get(std::string_view key) const noexcept;
        node *get(std::string_view key) noexcept;
        // throws error when the key is missing
        const node &at(std::string_view key) const;
        const_iterator begin() const noexcept;
        const_iterator end() const noexcept;

        // returns the previous value of the key if any
        std::optional<node> put(std::string key, node value);
        std::optional<node> erase(std::string_view key);
        void put_all(const compound &o);
        void clear() noexcept;

        // strict lookup: the value must have exactly the type T
        template<typename T>
        const T *get_if(std::string_view key) const noexcept;

        template<typename T>
        std::optional<T> get_strict(std::string_view key) const;

        template<typename T>
        T get_strict(std::string_view key, T fallback) const;

        // lenient lookup: any numeric value is converted to T
        template<typename T>
        std::optional<T> get_number(std::string_view key) const;

        template<typename T>
        T get_number(std::string_view key, T fallback) const;

        const list *get_list(std::string_view key, tag_type elem_type, bool empty_as_null) const noexcept;

        bool operator==(const compound &o) const;
    private:
        storage_type _entries;
        std::map<std::string, size_t, std::less<>> _index;

        void _reindex();
    };

    using node_value = std::variant<int8_t, int16_t, int32_t, int64_t, float, double,
        byte_array, std::string, list, compound, int_array, long_array>;

    template<typename T>
    inline constexpr tag_type tag_of = tag_type::end;
    template<> inline constexpr tag_type tag_of<int8_t> = tag_type::byte;
    template<> inline constexpr tag_type tag_of<int16_t> = tag_type::short_;
    template<> inline constexpr tag_type tag_of<int32_t> = tag_type::int_;
    template<> inline constexpr tag_type tag_of<int64_t> = tag_type::long_;
    template<> inline constexpr tag_type tag_of<float> = tag_type::float_;
    template<> inline constexpr tag_type tag_of<double> = tag_type::double_;
    template<> inline constexpr tag_type tag_of<byte_array> = tag_type::byte_array;
    template<> inline constexpr tag_type tag_of<std::string> = tag_type::string;
    template<> inline constexpr tag_type tag_of<list> = tag_type::list;
    template<> inline constexpr tag_type tag_of<compound> = tag_type::compound;
    template<> inline constexpr tag_type tag_of<int_array> = tag_type::int_array;
    template<> inline constexpr tag_type tag_of<long_array> = tag_type::long_array;

    template<typename T>
    concept numeric = std::is_same_v<T, bool> || std::is_same_v<T, int8_t> || std::is_same_v<T, int16_t>
        || std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t> || std::is_same_v<T, float> || std::is_same_v<T, double>;

    struct node {
        node(const int8_t v) noexcept: _val { std::in_place_type<int8_t>, v } {}
        node(const int16_t v) noexcept: _val { std::in_place_type<int16_t>, v } {}
        node(const int32_t v) noexcept: _val { std::in_place_type<int32_t>, v } {}
        node(const int64_t v) noexcept: _val { std::in_place_type<int64_t>, v } {}
        node(const float v) noexcept: _val { std::in_place_type<float>, v } {}
        node(const double v) noexcept: _val { std::in_place_type<double>, v } {}
        // stored as a byte of 1 or 0
        node(const bool v) noexcept: _val { std::in_place_type<int8_t>, static_cast<int8_t>(v ? 1 : 0) } {}
        node(std::string v) noexcept: _val { std::in_place_type<std::string>, std::move(v) } {}
        node(const std::string_view v): _val { std::in_place_type<std::string>, v } {}
        node(const char *v): _val { std::in_place_type<std::string>, v } {}
        node(byte_array v) noexcept: _val { std::in_place_type<byte_array>, std::move(v) } {}
        node(int_array v) noexcept: _val { std::in_place_type<int_array>, std::move(v) } {}
        node(long_array v) noexcept: _val { std::in_place_type<long_array>, std::move(v) } {}
        node(list v) noexcept: _val { std::in_place_type<list>, std::move(v) } {}
        node(compound v) noexcept: _val { std::in_place_type<compound>, std::move(v) } {}

        tag_type type() const noexcept
        {
            return static_cast<tag_type>(_val.index() + 1);
        }

        bool is_number() const noexcept
        {
            return _val.index() <= 5;
        }

        template<typename T>
        bool is() const noexcept
        {
            return std::holds_alternative<T>(_val);
        }

        template<typename T>
        const T *get_if() const noexcept
        {
            return std::get_if<T>(&_val);
        }

        template<typename T>
        T *get_if() noexcept
        {
            return std::get_if<T>(&_val);
        }

        template<typename T>
        const T &get() const
        {
            if (const auto *v = std::get_if<T>(&_val); v) [[likely]]
                return *v;
            throw type_mismatch_error { tag_of<T>, type() };
        }

        template<typename T>
        T &get()
        {
            if (auto *v = std::get_if<T>(&_val); v) [[likely]]
                return *v;
            throw type_mismatch_error { tag_of<T>, type() };
        }

        const node_value &value() const noexcept
        {
            return _val;
        }

        // numeric conversions; throw type_mismatch_error for non-numeric nodes
        bool as_bool() const;
        int8_t as_byte() const;
        int16_t as_short() const;
        int32_t as_int() const;
        int64_t as_long() const;
        float as_float() const;
        double as_double() const;

        template<numeric T>
        T as() const
        {
            if constexpr (std::is_same_v<T, bool>)
                return as_bool();
            else if constexpr (std::is_same_v<T, int8_t>)
                return as_byte();
            else if constexpr (std::is_same_v<T, int16_t>)
                return as_short();
            else if constexpr (std::is_same_v<T, int32_t>)
                return as_int();
            else if constexpr (std::is_same_v<T, int64_t>)
                return as_long();
            else if constexpr (std::is_same_v<T, float>)
                return as_float();
            else
                return as_double();
        }

        // float and double payloads are equal when their bit patterns are, with all NaNs being equal
        bool operator==(const node &o) const;
    private:
        node_value _val;
    };

    template<typename T>
    const T *compound::get_if(const std::string_view key) const noexcept
    {
        if (const auto *v = get(key); v)
            return v->get_if<T>();
        return nullptr;
    }

    template<typename T>
    std::optional<T> compound::get_strict(const std::string_view key) const
    {
        if constexpr (std::is_same_v<T, bool>) {
            if (const auto *v = get_if<int8_t>(key); v)
                return *v != 0;
        } else {
            if (const auto *v = get_if<T>(key); v)
                return *v;
        }
        return {};
    }

    template<typename T>
    T compound::get_strict(const std::string_view key, T fallback) const
    {
        if (auto v = get_strict<T>(key); v)
            return std::move(*v);
        return fallback;
    }

    template<typename T>
    std::optional<T> compound::get_number(const std::string_view key) const
    {
        static_assert(numeric<T>);
        if (const auto *v = get(key); v && v->is_number())
            return v->as<T>();
        return {};
    }

    template<typename T>
    T compound::get_number(const std::string_view key, const T fallback) const
    {
        return get_number<T>(key).value_or(fallback);
    }

    // SNBT-like quoting of string payloads and compound keys
    extern std::string quote(std::string_view s);
    extern std::string format_key(std::string_view key);
}

namespace fmt {
    template<>
    struct formatter<nbnt::nbt::list>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "[");
            for (auto it = v.begin(); it != v.end(); ++it)
                out_it = fmt::format_to(out_it, "{}{}", it == v.begin() ? "" : ", ", *it);
            return fmt::format_to(out_it, "]");
        }
    };

    template<>
    struct formatter<nbnt::nbt::compound>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "{{");
            for (auto it = v.begin(); it != v.end(); ++it)
                out_it = fmt::format_to(out_it, "{}{}: {}", it == v.begin() ? "" : ", ", nbnt::nbt::format_key(it->first), it->second);
            return fmt::format_to(out_it, "}}");
        }
    };

    template<>
    struct formatter<nbnt::nbt::node>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace nbnt::nbt;
            return std::visit([&ctx](const auto &val) {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, int8_t>) {
                    return fmt::format_to(ctx.out(), "{}b", static_cast<int>(val));
                } else if constexpr (std::is_same_v<T, int16_t>) {
                    return fmt::format_to(ctx.out(), "{}s", val);
                } else if constexpr (std::is_same_v<T, int32_t>) {
                    return fmt::format_to(ctx.out(), "{}", val);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    return fmt::format_to(ctx.out(), "{}L", val);
                } else if constexpr (std::is_same_v<T, float>) {
                    return fmt::format_to(ctx.out(), "{}f", val);
                } else if constexpr (std::is_same_v<T, double>) {
                    return fmt::format_to(ctx.out(), "{}d", val);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return fmt::format_to(ctx.out(), "{}", quote(val));
                } else if constexpr (std::is_same_v<T, byte_array>) {
                    auto out_it = fmt::format_to(ctx.out(), "[B;");
                    for (size_t i = 0; i < val.size(); ++i)
                        out_it = fmt::format_to(out_it, "{} {}b", i ? "," : "", static_cast<int>(val[i]));
                    return fmt::format_to(out_it, "]");
                } else if constexpr (std::is_same_v<T, int_array>) {
                    auto out_it = fmt::format_to(ctx.out(), "[I;");
                    for (size_t i = 0; i < val.size(); ++i)
                        out_it = fmt::format_to(out_it, "{} {}", i ? "," : "", val[i]);
                    return fmt::format_to(out_it, "]");
                } else if constexpr (std::is_same_v<T, long_array>) {
                    auto out_it = fmt::format_to(ctx.out(), "[L;");
                    for (size_t i = 0; i < val.size(); ++i)
                        out_it = fmt::format_to(out_it, "{} {}L", i ? "," : "", val[i]);
                    return fmt::format_to(out_it, "]");
                } else {
                    return fmt::format_to(ctx.out(), "{}", val);
                }
            }, v.value());
        }
    };
}

#endif // !NBNT_NBT_NODE_HPP
