/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef NBNT_JSON_HPP
#define NBNT_JSON_HPP

#include <boost/json.hpp>
#include <nbnt/common/bytes.hpp>

namespace nbnt::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        try {
            return boost::json::parse(static_cast<std::string_view>(buf), sp);
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to parse a json document of {} bytes", buf.size()), ex);
        }
    }
}

#endif // !NBNT_JSON_HPP
