/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <sstream>
#include <nbnt/common/test.hpp>
#include <nbnt/nbt/codec.hpp>

using namespace nbnt;
using namespace nbnt::nbt;

namespace {
    // a root list nesting depth lists, the innermost one being empty
    uint8_vector nested_lists(const size_t depth)
    {
        uint8_vector data = uint8_vector::from_hex("090000");
        for (size_t i = 1; i < depth; ++i)
            data << uint8_vector::from_hex("0900000001");
        data << uint8_vector::from_hex("0000000000");
        return data;
    }

    compound all_types()
    {
        compound inner { { "k", int64_t { -1 } } };
        return compound {
            { "byte", int8_t { -7 } },
            { "short", int16_t { 0x1234 } },
            { "int", -100000 },
            { "long", int64_t { 0x0102030405060708LL } },
            { "float", 1.25F },
            { "double", -2.5 },
            { "bytes", byte_array { 1, -1, 0 } },
            { "string", "caf\xC3\xA9 \xF0\x9F\x98\x80" },
            { "list", list { "a", "b" } },
            { "nested", list { list { 1, 2 }, list {} } },
            { "compound", inner },
            { "ints", int_array { 1, -2, 0x7FFFFFFF } },
            { "longs", long_array { std::numeric_limits<int64_t>::min(), 5 } },
            { "empty list", list {} },
            { "", "empty name" }
        };
    }
}

suite nbt_codec_suite = [] {
    "nbt::codec"_test = [] {
        "reference scenario"_test = [] {
            const auto data = uint8_vector::from_hex("0A0000" "030001" "61" "00000005" "080001" "62" "0001" "78" "00");
            auto lim = limiter::reference_protocol();
            const auto res = decode(data, lim);
            expect(res.has_value());
            test_same(res.value().first, std::string {});
            const compound expected { { "a", 5 }, { "b", "x" } };
            expect(res.value().second == node { expected });
            test_same(lim.length(), 19ULL);
            test_same(lim.depth(), 0ULL);
            test_same(encode(node { expected }), data);
        };
        "framings"_test = [] {
            test_same(encode(node { 5 }, framing::named, "a"), uint8_vector::from_hex("030001" "61" "00000005"));
            test_same(encode(node { 5 }, framing::unnamed), uint8_vector::from_hex("030000" "00000005"));
            test_same(encode(node { 5 }, framing::plain), uint8_vector::from_hex("03" "00000005"));
            vector_output out {};
            write_named(out, "ignored", nullptr);
            write_unnamed(out, nullptr);
            write(out, nullptr);
            test_same(out.bytes(), uint8_vector::from_hex("000000"));
        };
        "round trip"_test = [] {
            const node root { all_types() };
            for (const auto f: { framing::named, framing::unnamed, framing::plain }) {
                const auto data = encode(root, f, "root");
                auto lim = limiter::reference_protocol();
                buffer_input in { data };
                const auto res = decode(in, lim, f);
                expect(res.has_value()) << fmt::format("{}", f);
                expect(res.value().second == root) << fmt::format("{}: {}", f, res.value().second);
                test_same(res.value().first, std::string { f == framing::named ? "root" : "" });
                test_same(lim.length(), data.size());
                test_same(lim.depth(), 0ULL);
                test_same(in.consumed(), data.size());
                test_same(encode(res.value().second, f, res.value().first), data);
            }
        };
        "each type"_test = [] {
            for (const auto &[name, val]: all_types()) {
                auto lim = limiter::unlimited();
                const auto res = decode(encode(val, framing::named, name), lim);
                expect(res.has_value());
                test_same(res.value().first, name);
                expect(res.value().second == val) << name;
            }
        };
        "streams"_test = [] {
            std::stringstream ss {};
            stream_output out { ss };
            write_named(out, "x", node { list { 1.5, 2.5 } });
            write_named(out, "y", node { int8_t { 1 } });
            stream_input in { ss };
            auto lim = limiter::reference_protocol();
            const auto first = decode(in, lim);
            const auto second = decode(in, lim);
            expect(first.has_value() && second.has_value());
            test_same(first.value().first, std::string { "x" });
            test_same(first.value().second.get<list>().type(), tag_type::double_);
            test_same(second.value().second.get<int8_t>(), 1);
            expect(throws<incomplete_error>([&] { decode(in, lim); }));
        };
        "end tag"_test = [] {
            const auto data = uint8_vector::from_hex("00");
            for (const auto f: { framing::named, framing::unnamed, framing::plain }) {
                auto lim = limiter::reference_protocol();
                expect(!decode(data, lim, f).has_value());
                test_same(lim.length(), 1ULL);
            }
        };
        "empty list"_test = [] {
            auto lim = limiter::reference_protocol();
            const auto res = decode(uint8_vector::from_hex("090000" "00" "00000000"), lim);
            expect(res.has_value());
            expect(res.value().second.get<list>().empty());
            test_same(lim.depth(), 0ULL);
            const auto res2 = decode(uint8_vector::from_hex("090000" "03" "00000000"), lim);
            expect(res2.has_value());
            expect(res2.value().second.get<list>().empty());
            test_same(lim.depth(), 0ULL);
            test_same(encode(res2.value().second), uint8_vector::from_hex("090000" "00" "00000000"));
        };
        "invalid lengths"_test = [] {
            auto lim = limiter::reference_protocol();
            expect(throws<invalid_length_error>([&] { decode(uint8_vector::from_hex("090000" "00" "00000001"), lim); }));
            expect(throws<negative_length_error>([&] { decode(uint8_vector::from_hex("090000" "03" "FFFFFFFF"), lim); }));
            expect(throws<negative_length_error>([&] { decode(uint8_vector::from_hex("090000" "0A" "80000000"), lim); }));
            expect(throws<negative_length_error>([&] { decode(uint8_vector::from_hex("070000" "FFFFFFFF"), lim); }));
            expect(throws<negative_length_error>([&] { decode(uint8_vector::from_hex("0B0000" "FFFFFFFF"), lim); }));
        };
        "zero length arrays"_test = [] {
            auto lim = limiter::reference_protocol();
            const auto res = decode(uint8_vector::from_hex("070000" "00000000"), lim);
            expect(res.has_value());
            expect(res.value().second.get<byte_array>().empty());
            test_same(lim.length(), 7ULL);
        };
        "unknown types"_test = [] {
            auto lim = limiter::reference_protocol();
            expect(throws<unknown_type_error>([&] { decode(uint8_vector::from_hex("0D0000"), lim); }));
            expect(throws<unknown_type_error>([&] { decode(uint8_vector::from_hex("FF"), lim, framing::plain); }));
            expect(throws<unknown_type_error>([&] { decode(uint8_vector::from_hex("090000" "0D" "00000001" "00"), lim); }));
            expect(throws<unknown_type_error>([] { decoder_for(13); }));
            expect(decoder_for(0) != nullptr);
        };
        "long array gating"_test = [] {
            const auto data = uint8_vector::from_hex("0C0000" "00000001" "0000000000000007");
            auto lim = limiter::reference_protocol();
            const auto res = decode(data, lim);
            expect(res.has_value());
            expect(res.value().second == node { long_array { 7 } });
            auto legacy = limiter::reference_protocol(limiter::policy { .allow_long_arrays=false });
            expect(throws<unknown_type_error>([&] { decode(data, legacy); }));
            test_same(legacy.length(), 3ULL);
        };
        "depth"_test = [] {
            auto lim = limiter::reference_protocol();
            const auto res = decode(nested_lists(512), lim);
            expect(res.has_value());
            test_same(lim.depth(), 0ULL);
            auto lim2 = limiter::reference_protocol();
            expect(throws<depth_overflow_error>([&] { decode(nested_lists(513), lim2); }));
            test_same(lim2.depth(), 512ULL);
            auto lim3 = limiter::reference_protocol();
            expect(throws<depth_overflow_error>([&] { decode(nested_lists(600), lim3); }));
            auto unl = limiter::unlimited();
            expect(decode(nested_lists(600), unl).has_value());
        };
        "depth of compounds"_test = [] {
            auto lim = limiter { 0x1000, 2 };
            expect(decode(uint8_vector::from_hex("0A0000" "0A0001" "61" "00" "00"), lim).has_value());
            test_same(lim.depth(), 0ULL);
            expect(throws<depth_overflow_error>([&] { decode(uint8_vector::from_hex("0A0000" "0A0001" "61" "0A0001" "62" "00" "00" "00"), lim); }));
        };
        "length limit"_test = [] {
            const auto data = encode(node { compound { { "a", 5 }, { "b", "x" } } });
            limiter lim { 18, 512 };
            expect(throws<length_error>([&] { decode(data, lim); }));
            limiter exact { 19, 512 };
            expect(decode(data, exact).has_value());
        };
        "array length is charged before allocation"_test = [] {
            // claims 0x7FFFFFFF longs with only 8 bytes of payload
            const auto data = uint8_vector::from_hex("0C0000" "7FFFFFFF" "0000000000000007");
            auto lim = limiter::reference_protocol();
            expect(throws<length_error>([&] { decode(data, lim); }));
            test_same(lim.length(), 7ULL);
            auto unl = limiter::unlimited();
            expect(throws<incomplete_error>([&] { decode(uint8_vector::from_hex("070000" "00010000" "01"), unl); }));
        };
        "truncated input"_test = [] {
            auto lim = limiter::reference_protocol();
            expect(throws<incomplete_error>([&] { decode(uint8_vector::from_hex("0A0000" "030001" "61" "00000005"), lim); }));
            expect(throws<incomplete_error>([&] { decode(uint8_vector::from_hex("080000" "0005" "6162"), lim); }));
            expect(throws<incomplete_error>([&] { decode(uint8_vector {}, lim); }));
        };
        "strict empty names"_test = [] {
            const auto data = uint8_vector::from_hex("030001" "61" "00000005");
            auto lenient = limiter::reference_protocol();
            const auto res = decode(data, lenient, framing::unnamed);
            expect(res.has_value());
            expect(res.value().second == node { 5 });
            auto strict = limiter::reference_protocol(limiter::policy { .strict_empty_names=true });
            expect(throws<non_empty_name_error>([&] { decode(data, strict, framing::unnamed); }));
            test_same(strict.length(), 3ULL);
            auto strict2 = limiter::reference_protocol(limiter::policy { .strict_empty_names=true });
            expect(decode(uint8_vector::from_hex("030000" "00000005"), strict2, framing::unnamed).has_value());
        };
        "strict empty names with quick errors"_test = [] {
            const auto data = uint8_vector::from_hex("030001" "61" "00000005");
            auto lim = limiter::reference_protocol(limiter::policy { .strict_empty_names=true, .quick_errors=true });
            expect(throws<malformed_error>([&] { decode(data, lim, framing::unnamed); }));
            std::string msg {};
            try {
                auto lim2 = limiter::reference_protocol(limiter::policy { .strict_empty_names=true, .quick_errors=true });
                decode(data, lim2, framing::unnamed);
            } catch (const non_empty_name_error &ex) {
                msg = ex.what();
            }
            test_same(msg, std::string { "Non-empty name in an unnamed NBT." });
        };
        "quick errors"_test = [] {
            const limiter::policy quick { .quick_errors=true };
            auto lim = limiter::reference_protocol(quick);
            expect(throws<depth_overflow_error>([&] { decode(nested_lists(600), lim); }));
            try {
                auto lim2 = limiter::reference_protocol(quick);
                decode(nested_lists(600), lim2);
            } catch (const depth_overflow_error &ex) {
                test_same(std::string { ex.what() }, std::string { "Max NBT depth reached." });
            }
            auto lim3 = limiter::reference_protocol(quick);
            expect(throws<unknown_type_error>([&] { decode(uint8_vector::from_hex("0D0000"), lim3); }));
            expect(throws<invalid_length_error>([&] { decode(uint8_vector::from_hex("090000" "00" "00000001"), lim3); }));
            auto lim4 = limiter { 4, 512, quick };
            expect(throws<length_error>([&] { decode(uint8_vector::from_hex("030000" "00000005"), lim4); }));
            auto lim5 = limiter::reference_protocol(limiter::policy { .allow_long_arrays=false, .quick_errors=true });
            expect(throws<unknown_type_error>([&] { decode(uint8_vector::from_hex("0C0000" "00000000"), lim5); }));
            auto lim6 = limiter::reference_protocol(quick);
            expect(throws<negative_length_error>([&] { decode(uint8_vector::from_hex("090000" "03" "FFFFFFFF"), lim6); }));
        };
        "string too long"_test = [] {
            const std::string s(0x10000, 'a');
            expect(throws<error>([&] { encode(node { s }); }));
            const std::string ok(0xFFFF, 'a');
            test_same(encode(node { ok }, framing::plain).size(), 3ULL + 0xFFFF);
        };
        "nul in strings"_test = [] {
            const std::string s { "a\0b", 3 };
            const auto data = encode(node { s }, framing::plain);
            test_same(data, uint8_vector::from_hex("08" "0004" "61C08062"));
            auto lim = limiter::reference_protocol();
            test_same(decode(data, lim, framing::plain).value().second.get<std::string>(), s);
        };
    };
};
