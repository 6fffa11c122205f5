/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/cli.hpp>
#include <nbnt/common/file.hpp>
#include <nbnt/common/test.hpp>
#include <nbnt/nbt/codec.hpp>

using namespace nbnt;
using namespace nbnt::nbt;

namespace {
    node sample_root()
    {
        return node { compound { { "id", 42 }, { "name", "sample" }, { "scores", list { 1.5, 2.5 } } } };
    }
}

suite cli_commands_suite = [] {
    "cli::commands"_test = [] {
        const auto root = sample_root();
        const file::tmp in_path { "nbnt-cli-commands-in.nbt" };
        file::write(in_path, encode(root, framing::named, "root"));
        "reframe"_test = [&] {
            const file::tmp out_path { "nbnt-cli-commands-out.nbt" };
            const char *argv[] { "nbnt", "reframe", in_path.path().c_str(), out_path.path().c_str(), "--output-framing=plain" };
            test_same(cli::run(5, argv), 0);
            const auto out = file::read(out_path);
            test_same(out, encode(root, framing::plain));
            auto lim = limiter::reference_protocol();
            const auto res = decode(out, lim, framing::plain);
            expect(res.has_value() && res->second == root);
        };
        "reframe renames"_test = [&] {
            const file::tmp out_path { "nbnt-cli-commands-renamed.nbt" };
            const char *argv[] { "nbnt", "reframe", in_path.path().c_str(), out_path.path().c_str(), "--name=renamed" };
            test_same(cli::run(5, argv), 0);
            auto lim = limiter::reference_protocol();
            const auto res = decode(file::read(out_path), lim);
            expect(res.has_value());
            test_same(res.value().first, std::string { "renamed" });
            expect(res.value().second == root);
        };
        "check"_test = [&] {
            const char *ok_argv[] { "nbnt", "check", in_path.path().c_str() };
            test_same(cli::run(3, ok_argv), 0);
            const char *unnamed_argv[] { "nbnt", "check", in_path.path().c_str(), "--framing=unnamed" };
            test_same(cli::run(4, unnamed_argv), 0);
            const char *strict_argv[] { "nbnt", "check", in_path.path().c_str(), "--framing=unnamed", "--limits=etc/limits.json", "--profile=strict" };
            test_same(cli::run(6, strict_argv), 1);
            const char *missing_profile_argv[] { "nbnt", "check", in_path.path().c_str(), "--profile=missing" };
            test_same(cli::run(4, missing_profile_argv), 1);
            auto bytes = encode(root, framing::named, "root");
            bytes.resize(bytes.size() - 1);
            const file::tmp truncated { "nbnt-cli-commands-truncated.nbt" };
            file::write(truncated, bytes);
            const char *truncated_argv[] { "nbnt", "check", truncated.path().c_str() };
            test_same(cli::run(3, truncated_argv), 1);
        };
        "dump"_test = [&] {
            const char *argv[] { "nbnt", "dump", in_path.path().c_str() };
            test_same(cli::run(3, argv), 0);
            const char *missing_argv[] { "nbnt", "dump" };
            test_same(cli::run(2, missing_argv), 1);
        };
    };
};
