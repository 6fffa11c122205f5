/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/cli/common.hpp>

namespace nbnt::cli::dump {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "dump";
            cmd.desc = "decode a tag file and print its tree as text";
            cmd.args.expect({ "<file>" });
            add_decode_options(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            const auto bytes = file::read(path);
            auto lim = make_limiter(opts);
            nbt::buffer_input in { bytes };
            const auto res = nbt::decode(in, lim, framing_option(opts, "framing"));
            if (res) {
                if (res->first.empty())
                    std::cout << fmt::format("{}\n", res->second);
                else
                    std::cout << fmt::format("{}: {}\n", nbt::format_key(res->first), res->second);
            } else {
                std::cout << "end tag: no value\n";
            }
            std::cout << fmt::format("consumed {} of {} bytes\n", in.consumed(), bytes.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
