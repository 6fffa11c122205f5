/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <cmath>
#include <limits>
#include <nbnt/nbt/node.hpp>

namespace nbnt::nbt {
    /* list */

    list::list() =default;
    list::list(const list &o) =default;
    list::list(list &&o) noexcept =default;
    list::~list() =default;
    list &list::operator=(const list &o) =default;
    list &list::operator=(list &&o) noexcept =default;

    list::list(const std::initializer_list<node> items):
        list(storage_type(items))
    {
    }

    list::list(storage_type items)
    {
        _validate_homogeneous(items);
        _items = std::move(items);
    }

    tag_type list::type() const noexcept
    {
        return _items.empty() ? tag_type::end : _items.front().type();
    }

    void list::validate_type(const node &n) const
    {
        const auto my_type = type();
        if (my_type != tag_type::end && my_type != n.type()) [[unlikely]]
            throw type_mismatch_error { my_type, n.type() };
    }

    size_t list::size() const noexcept
    {
        return _items.size();
    }

    bool list::empty() const noexcept
    {
        return _items.empty();
    }

    const node &list::at(const size_t idx) const
    {
        _check_index(idx, _items.size());
        return _items[idx];
    }

    const node &list::operator[](const size_t idx) const
    {
        return _items[idx];
    }

    list::const_iterator list::begin() const noexcept
    {
        return _items.begin();
    }

    list::const_iterator list::end() const noexcept
    {
        return _items.end();
    }

    const list::storage_type &list::items() const noexcept
    {
        return _items;
    }

    void list::add(node n)
    {
        validate_type(n);
        _items.emplace_back(std::move(n));
    }

    void list::insert(const size_t idx, node n)
    {
        _check_index(idx, _items.size() + 1);
        validate_type(n);
        _items.insert(_items.begin() + idx, std::move(n));
    }

    void list::add_all(storage_type items)
    {
        if (items.empty())
            return;
        _validate_homogeneous(items);
        validate_type(items.front());
        _items.reserve(_items.size() + items.size());
        for (auto &n: items)
            _items.emplace_back(std::move(n));
    }

    node list::set(const size_t idx, node n)
    {
        _check_index(idx, _items.size());
        validate_type(n);
        node prev = std::move(_items[idx]);
        _items[idx] = std::move(n);
        return prev;
    }

    node list::erase(const size_t idx)
    {
        _check_index(idx, _items.size());
        node prev = std::move(_items[idx]);
        _items.erase(_items.begin() + idx);
        return prev;
    }

    bool list::remove(const node &n)
    {
        if (const auto idx = index_of(n); idx) {
            _items.erase(_items.begin() + *idx);
            return true;
        }
        return false;
    }

    bool list::contains(const node &n) const
    {
        return index_of(n).has_value();
    }

    std::optional<size_t> list::index_of(const node &n) const
    {
        if (const auto it = std::find(_items.begin(), _items.end(), n); it != _items.end())
            return static_cast<size_t>(it - _items.begin());
        return {};
    }

    void list::clear() noexcept
    {
        _items.clear();
    }

    bool list::operator==(const list &o) const
    {
        return _items == o._items;
    }

    void list::_check_index(const size_t idx, const size_t max_idx) const
    {
        if (idx >= max_idx) [[unlikely]]
            throw error(fmt::format("list index {} is out of range: the list has {} elements", idx, _items.size()));
    }

    void list::_validate_homogeneous(const storage_type &items) const
    {
        if (items.empty())
            return;
        const auto first_type = items.front().type();
        for (const auto &n: items) {
            if (n.type() != first_type) [[unlikely]]
                throw type_mismatch_error { first_type, n.type() };
        }
    }

    /* compound */

    compound::compound() =default;
    compound::compound(const compound &o) =default;
    compound::compound(compound &&o) noexcept =default;
    compound::~compound() =default;
    compound &compound::operator=(const compound &o) =default;
    compound &compound::operator=(compound &&o) noexcept =default;

    compound::compound(const std::initializer_list<entry> entries)
    {
        for (const auto &[k, v]: entries)
            put(k, v);
    }

    compound::compound(storage_type entries)
    {
        _entries.reserve(entries.size());
        for (auto &[k, v]: entries)
            put(std::move(k), std::move(v));
    }

    size_t compound::size() const noexcept
    {
        return _entries.size();
    }

    bool compound::empty() const noexcept
    {
        return _entries.empty();
    }

    bool compound::contains(const std::string_view key) const noexcept
    {
        return _index.find(key) != _index.end();
    }

    const node *compound::get(const std::string_view key) const noexcept
    {
        if (const auto it = _index.find(key); it != _index.end())
            return &_entries[it->second].second;
        return nullptr;
    }

    node *compound::get(const std::string_view key) noexcept
    {
        if (const auto it = _index.find(key); it != _index.end())
            return &_entries[it->second].second;
        return nullptr;
    }

    const node &compound::at(const std::string_view key) const
    {
        if (const auto *v = get(key); v) [[likely]]
            return *v;
        throw error(fmt::format("compound has no key {}", quote(key)));
    }

    compound::const_iterator compound::begin() const noexcept
    {
        return _entries.begin();
    }

    compound::const_iterator compound::end() const noexcept
    {
        return _entries.end();
    }

    std::optional<node> compound::put(std::string key, node value)
    {
        if (const auto it = _index.find(key); it != _index.end()) {
            auto &slot = _entries[it->second].second;
            std::optional<node> prev { std::move(slot) };
            slot = std::move(value);
            return prev;
        }
        _index.emplace(key, _entries.size());
        _entries.emplace_back(std::move(key), std::move(value));
        return {};
    }

    std::optional<node> compound::erase(const std::string_view key)
    {
        const auto it = _index.find(key);
        if (it == _index.end())
            return {};
        const auto idx = it->second;
        std::optional<node> prev { std::move(_entries[idx].second) };
        _entries.erase(_entries.begin() + idx);
        _reindex();
        return prev;
    }

    void compound::put_all(const compound &o)
    {
        for (const auto &[k, v]: o)
            put(k, v);
    }

    void compound::clear() noexcept
    {
        _entries.clear();
        _index.clear();
    }

    const list *compound::get_list(const std::string_view key, const tag_type elem_type, const bool empty_as_null) const noexcept
    {
        const auto *l = get_if<list>(key);
        if (!l)
            return nullptr;
        if (l->empty())
            return empty_as_null ? nullptr : l;
        return l->type() == elem_type ? l : nullptr;
    }

    bool compound::operator==(const compound &o) const
    {
        if (_entries.size() != o._entries.size())
            return false;
        for (const auto &[k, v]: _entries) {
            const auto *ov = o.get(k);
            if (!ov || !(*ov == v))
                return false;
        }
        return true;
    }

    void compound::_reindex()
    {
        _index.clear();
        for (size_t i = 0; i < _entries.size(); ++i)
            _index.emplace(_entries[i].first, i);
    }

    /* node */

    namespace {
        // saturating truncation toward zero with NaN mapping to zero
        template<typename I, typename F>
        I saturate(const F v) noexcept
        {
            if (std::isnan(v))
                return 0;
            if (v >= static_cast<F>(std::numeric_limits<I>::max()))
                return std::numeric_limits<I>::max();
            if (v <= static_cast<F>(std::numeric_limits<I>::min()))
                return std::numeric_limits<I>::min();
            return static_cast<I>(v);
        }

        float narrow_double(const double v) noexcept
        {
            if (std::isfinite(v) && std::fabs(v) > static_cast<double>(std::numeric_limits<float>::max()))
                return v > 0 ? std::numeric_limits<float>::infinity() : -std::numeric_limits<float>::infinity();
            return static_cast<float>(v);
        }

        template<typename T>
        bool same_floating(const T a, const T b) noexcept
        {
            if (std::isnan(a) || std::isnan(b))
                return std::isnan(a) && std::isnan(b);
            return a == b && std::signbit(a) == std::signbit(b);
        }

        template<typename R, typename IF, typename FF>
        R convert(const node &n, const IF &from_int, const FF &from_float)
        {
            return std::visit([&](const auto &v) -> R {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_integral_v<T>)
                    return from_int(static_cast<int64_t>(v));
                else if constexpr (std::is_floating_point_v<T>)
                    return from_float(v);
                else
                    throw type_mismatch_error(fmt::format("a numeric NBT is required but got {}", n.type()));
            }, n.value());
        }
    }

    bool node::as_bool() const
    {
        return convert<bool>(*this,
            [](const int64_t v) { return v != 0; },
            [](const auto v) { return v != 0; });
    }

    int8_t node::as_byte() const
    {
        return convert<int8_t>(*this,
            [](const int64_t v) { return static_cast<int8_t>(v); },
            [](const auto v) { return static_cast<int8_t>(saturate<int32_t>(v)); });
    }

    int16_t node::as_short() const
    {
        return convert<int16_t>(*this,
            [](const int64_t v) { return static_cast<int16_t>(v); },
            [](const auto v) { return static_cast<int16_t>(saturate<int32_t>(v)); });
    }

    int32_t node::as_int() const
    {
        return convert<int32_t>(*this,
            [](const int64_t v) { return static_cast<int32_t>(v); },
            [](const auto v) { return saturate<int32_t>(v); });
    }

    int64_t node::as_long() const
    {
        return convert<int64_t>(*this,
            [](const int64_t v) { return v; },
            [](const auto v) { return saturate<int64_t>(v); });
    }

    float node::as_float() const
    {
        return convert<float>(*this,
            [](const int64_t v) { return static_cast<float>(v); },
            [](const auto v) {
                if constexpr (std::is_same_v<std::decay_t<decltype(v)>, double>)
                    return narrow_double(v);
                else
                    return v;
            });
    }

    double node::as_double() const
    {
        return convert<double>(*this,
            [](const int64_t v) { return static_cast<double>(v); },
            [](const auto v) { return static_cast<double>(v); });
    }

    bool node::operator==(const node &o) const
    {
        if (_val.index() != o._val.index())
            return false;
        return std::visit([&o](const auto &a) {
            using T = std::decay_t<decltype(a)>;
            const auto &b = std::get<T>(o._val);
            if constexpr (std::is_floating_point_v<T>)
                return same_floating(a, b);
            else
                return a == b;
        }, _val);
    }

    /* text */

    std::string quote(const std::string_view s)
    {
        std::string res {};
        res.reserve(s.size() + 2);
        res += '"';
        for (const char c: s) {
            switch (c) {
                case '"': res += "\\\""; break;
                case '\\': res += "\\\\"; break;
                case '\n': res += "\\n"; break;
                case '\t': res += "\\t"; break;
                default: res += c; break;
            }
        }
        res += '"';
        return res;
    }

    std::string format_key(const std::string_view key)
    {
        if (key.empty())
            return quote(key);
        for (const char c: key) {
            const bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                || c == '_' || c == '-' || c == '.' || c == '+';
            if (!plain)
                return quote(key);
        }
        return std::string { key };
    }
}
