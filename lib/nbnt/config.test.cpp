/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/common/test.hpp>
#include <nbnt/config.hpp>

using namespace nbnt;

suite config_suite = [] {
    "config"_test = [] {
        "json"_test = [] {
            const config_json cfg { json::object { { "strict", json::object { { "max_depth", 16 } } } } };
            expect(cfg.at("strict").at("max_depth").as_int64() == 16_ll);
            expect(throws<error>([&] { cfg.at("missing"); }));
            test_same(std::string { static_cast<std::string_view>(cfg.bytes()) }, std::string { R"({"strict":{"max_depth":16}})" });
        };
        "file"_test = [] {
            const file::tmp path { "nbnt-config-test.json" };
            file::write(path, std::string_view { R"({ "legacy": { "allow_long_arrays": false } })" });
            const config_file cfg { path };
            expect(cfg.at("legacy").at("allow_long_arrays").as_bool() == false);
            test_same(cfg.json().size(), 1ULL);
            expect(throws<error>([&] { cfg.at("strict"); }));
        };
        "not an object"_test = [] {
            const file::tmp path { "nbnt-config-test-array.json" };
            file::write(path, std::string_view { "[1, 2, 3]" });
            expect(throws<error>([&] { config_file cfg { path }; }));
            file::write(path, std::string_view { "{ broken" });
            expect(throws<error>([&] { config_file cfg { path }; }));
        };
        "missing file"_test = [] {
            expect(throws<error_sys>([] { config_file cfg { "/nonexistent/nbnt/limits.json" }; }));
        };
    };
};
