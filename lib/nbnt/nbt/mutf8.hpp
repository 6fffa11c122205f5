/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_NBT_MUTF8_HPP
#define NBNT_NBT_MUTF8_HPP

#include <string>
#include <string_view>
#include <nbnt/common/bytes.hpp>

/*
 * Modified UTF-8 as used by length-prefixed strings of the tag format:
 * U+0000 is encoded as C0 80 and supplementary characters as two 3-byte surrogates.
 * In memory, strings are kept as standard UTF-8.
 */
namespace nbnt::nbt::mutf8 {
    static constexpr size_t max_encoded_size = 0xFFFF;

    // throws malformed_error on an invalid or truncated sequence and on unpaired surrogates
    extern std::string decode(buffer bytes);
    // throws malformed_error when utf8 is not valid UTF-8
    extern uint8_vector encode(std::string_view utf8);
    extern size_t encoded_size(std::string_view utf8);
}

#endif // !NBNT_NBT_MUTF8_HPP
