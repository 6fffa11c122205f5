/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/cli/common.hpp>

namespace nbnt::cli::reframe {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "reframe";
            cmd.desc = "decode a tag file and write its root value with another framing";
            cmd.args.expect({ "<in-file>", "<out-file>" });
            add_decode_options(cmd);
            cmd.opts.emplace("output-framing", option_config { "the framing of the output: named, unnamed or plain", "named", validate_framing });
            cmd.opts.emplace("name", option_config { "the root name of the named output, the input name by default" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &in_path = args.at(0);
            const auto &out_path = args.at(1);
            auto lim = make_limiter(opts);
            const auto res = nbt::decode(file::read(in_path), lim, framing_option(opts, "framing"));
            if (!res)
                throw error(fmt::format("{} contains no root value", in_path));
            std::string name = res->first;
            if (const auto it = opts.find("name"); it != opts.end() && it->second)
                name = *it->second;
            const auto out_framing = framing_option(opts, "output-framing");
            const auto bytes = nbt::encode(res->second, out_framing, name);
            file::write(out_path, bytes);
            logger::info("wrote {} bytes with the {} framing to {}", bytes.size(), out_framing, out_path);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
