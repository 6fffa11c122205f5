/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <iterator>
#include <vector>
#include <utfcpp/utf8.h>
#include <nbnt/nbt/errors.hpp>
#include <nbnt/nbt/mutf8.hpp>

namespace nbnt::nbt::mutf8 {
    static std::vector<uint16_t> _decode_units(const buffer bytes)
    {
        std::vector<uint16_t> units {};
        units.reserve(bytes.size());
        for (size_t i = 0; i < bytes.size(); ) {
            const uint8_t c = bytes[i];
            switch (c >> 4) {
                case 0: case 1: case 2: case 3: case 4: case 5: case 6: case 7:
                    units.emplace_back(c);
                    ++i;
                    break;
                case 12: case 13: {
                    if (i + 2 > bytes.size()) [[unlikely]]
                        throw malformed_error(fmt::format("partial character at the end of a modified utf8 string at byte {}", i));
                    const uint8_t c2 = bytes[i + 1];
                    if ((c2 & 0xC0) != 0x80) [[unlikely]]
                        throw malformed_error(fmt::format("malformed modified utf8 input around byte {}", i + 1));
                    units.emplace_back(static_cast<uint16_t>(((c & 0x1F) << 6) | (c2 & 0x3F)));
                    i += 2;
                    break;
                }
                case 14: {
                    if (i + 3 > bytes.size()) [[unlikely]]
                        throw malformed_error(fmt::format("partial character at the end of a modified utf8 string at byte {}", i));
                    const uint8_t c2 = bytes[i + 1];
                    const uint8_t c3 = bytes[i + 2];
                    if ((c2 & 0xC0) != 0x80 || (c3 & 0xC0) != 0x80) [[unlikely]]
                        throw malformed_error(fmt::format("malformed modified utf8 input around byte {}", i + 2));
                    units.emplace_back(static_cast<uint16_t>(((c & 0x0F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F)));
                    i += 3;
                    break;
                }
                default:
                    throw malformed_error(fmt::format("malformed modified utf8 input around byte {}", i));
            }
        }
        return units;
    }

    std::string decode(const buffer bytes)
    {
        const auto units = _decode_units(bytes);
        std::string res {};
        res.reserve(units.size());
        try {
            utf8::utf16to8(units.begin(), units.end(), std::back_inserter(res));
        } catch (const utf8::exception &ex) {
            throw malformed_error(fmt::format("modified utf8 string of {} bytes has an unpaired surrogate: {}", bytes.size(), ex.what()));
        }
        return res;
    }

    template<typename F>
    static void _for_each_unit(const std::string_view utf8, const F &observer)
    {
        auto it = utf8.begin();
        const auto end = utf8.end();
        try {
            while (it != end) {
                const uint32_t cp = utf8::next(it, end);
                if (cp >= 0x10000) {
                    const uint32_t v = cp - 0x10000;
                    observer(static_cast<uint16_t>(0xD800 + (v >> 10)));
                    observer(static_cast<uint16_t>(0xDC00 + (v & 0x3FF)));
                } else {
                    observer(static_cast<uint16_t>(cp));
                }
            }
        } catch (const utf8::exception &ex) {
            throw malformed_error(fmt::format("invalid utf8 string at byte {}: {}", std::distance(utf8.begin(), it), ex.what()));
        }
    }

    static size_t _unit_size(const uint16_t u) noexcept
    {
        if (u != 0 && u < 0x80)
            return 1;
        if (u < 0x800)
            return 2;
        return 3;
    }

    size_t encoded_size(const std::string_view utf8)
    {
        size_t sz = 0;
        _for_each_unit(utf8, [&](const uint16_t u) { sz += _unit_size(u); });
        return sz;
    }

    uint8_vector encode(const std::string_view utf8)
    {
        uint8_vector res {};
        res.reserve(utf8.size());
        _for_each_unit(utf8, [&](const uint16_t u) {
            switch (_unit_size(u)) {
                case 1:
                    res << static_cast<uint8_t>(u);
                    break;
                case 2:
                    res << static_cast<uint8_t>(0xC0 | ((u >> 6) & 0x1F));
                    res << static_cast<uint8_t>(0x80 | (u & 0x3F));
                    break;
                default:
                    res << static_cast<uint8_t>(0xE0 | ((u >> 12) & 0x0F));
                    res << static_cast<uint8_t>(0x80 | ((u >> 6) & 0x3F));
                    res << static_cast<uint8_t>(0x80 | (u & 0x3F));
                    break;
            }
        });
        return res;
    }
}
