/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/cli.hpp>
#include <nbnt/common/test.hpp>

using namespace nbnt;

namespace {
    struct echo_cmd: cli::command {
        mutable cli::parse_result last {};

        void configure(cli::config &cmd) const override
        {
            cmd.name = "echo";
            cmd.desc = "remembers its arguments";
            cmd.args.expect({ "<first>", "[<rest>...]" });
            cmd.opts.emplace("mode", cli::option_config { "fast or slow", "fast", [](const auto &v) -> std::optional<std::string> {
                if (v && (*v == "fast" || *v == "slow"))
                    return {};
                return "must be fast or slow";
            } });
            cmd.opts.emplace("flag", cli::option_config { "a switch" });
        }

        void run(const cli::arguments &args, const cli::options &opts) const override
        {
            last = { args, opts };
            if (args.at(0) == "fail")
                throw error("requested failure");
        }
    };
}

suite cli_suite = [] {
    "cli"_test = [] {
        const auto cmd = std::make_shared<echo_cmd>();
        const cli::command::command_list cmds { cmd };
        cli::config cfg {};
        cmd->configure(cfg);
        "parse"_test = [&] {
            const auto pr = cmd->parse(cfg, { "a", "--flag", "b", "--mode=slow" });
            test_same(pr.args, cli::arguments { "a", "b" });
            test_same(pr.opts.at("mode").value(), std::string { "slow" });
            expect(pr.opts.contains("flag") && !pr.opts.at("flag"));
        };
        "defaults"_test = [&] {
            const auto pr = cmd->parse(cfg, { "a" });
            test_same(pr.opts.at("mode").value(), std::string { "fast" });
            expect(!pr.opts.contains("flag"));
        };
        "invalid"_test = [&] {
            expect(throws<error>([&] { cmd->parse(cfg, {}); }));
            expect(throws<error>([&] { cmd->parse(cfg, { "a", "--unknown" }); }));
            expect(throws<error>([&] { cmd->parse(cfg, { "a", "--mode=medium" }); }));
            expect(throws<error>([&] { cmd->parse(cfg, { "a", "--flag", "--flag" }); }));
        };
        "run"_test = [&] {
            const char *ok_argv[] { "nbnt", "echo", "x", "--mode=slow" };
            test_same(cli::run(4, ok_argv, cmds), 0);
            test_same(cmd->last.args, cli::arguments { "x" });
            const char *fail_argv[] { "nbnt", "echo", "fail" };
            test_same(cli::run(3, fail_argv, cmds), 1);
            const char *unknown_argv[] { "nbnt", "missing" };
            test_same(cli::run(2, unknown_argv, cmds), 1);
            const char *usage_argv[] { "nbnt" };
            test_same(cli::run(1, usage_argv, cmds), 1);
        };
    };
};
