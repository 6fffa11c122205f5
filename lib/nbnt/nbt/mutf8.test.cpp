/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/common/test.hpp>
#include <nbnt/nbt/errors.hpp>
#include <nbnt/nbt/mutf8.hpp>

using namespace nbnt;
using namespace nbnt::nbt;

suite nbt_mutf8_suite = [] {
    "nbt::mutf8"_test = [] {
        "ascii"_test = [] {
            test_same(mutf8::encode("abc"), uint8_vector::from_hex("616263"));
            test_same(mutf8::decode(uint8_vector::from_hex("616263")), std::string { "abc" });
            test_same(mutf8::encode(""), uint8_vector {});
            test_same(mutf8::decode(uint8_vector {}), std::string {});
        };
        "nul"_test = [] {
            const std::string s { "a\0b", 3 };
            test_same(mutf8::encode(s), uint8_vector::from_hex("61C08062"));
            test_same(mutf8::encoded_size(s), 4ULL);
            test_same(mutf8::decode(uint8_vector::from_hex("61C08062")), s);
        };
        "two and three bytes"_test = [] {
            // U+00E9 and U+20AC
            const std::string s { "\xC3\xA9\xE2\x82\xAC" };
            test_same(mutf8::encode(s), uint8_vector::from_hex("C3A9E282AC"));
            test_same(mutf8::decode(uint8_vector::from_hex("C3A9E282AC")), s);
        };
        "supplementary"_test = [] {
            // U+1F600 as a surrogate pair D83D DE00
            const std::string s { "\xF0\x9F\x98\x80" };
            const auto enc = uint8_vector::from_hex("EDA0BDEDB880");
            test_same(mutf8::encode(s), enc);
            test_same(mutf8::encoded_size(s), 6ULL);
            test_same(mutf8::decode(enc), s);
        };
        "partial"_test = [] {
            expect(throws<malformed_error>([] { mutf8::decode(uint8_vector::from_hex("61C3")); }));
            expect(throws<malformed_error>([] { mutf8::decode(uint8_vector::from_hex("E282")); }));
        };
        "malformed"_test = [] {
            expect(throws<malformed_error>([] { mutf8::decode(uint8_vector::from_hex("80")); }));
            expect(throws<malformed_error>([] { mutf8::decode(uint8_vector::from_hex("F09F9880")); }));
            expect(throws<malformed_error>([] { mutf8::decode(uint8_vector::from_hex("C341")); }));
        };
        "unpaired surrogate"_test = [] {
            expect(throws<malformed_error>([] { mutf8::decode(uint8_vector::from_hex("EDA0BD41")); }));
            expect(throws<malformed_error>([] { mutf8::decode(uint8_vector::from_hex("EDB880")); }));
        };
        "invalid utf8 input"_test = [] {
            expect(throws<malformed_error>([] { mutf8::encode(std::string_view { "\xFF" }); }));
        };
    };
};
