/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/cli/common.hpp>

namespace nbnt::cli::check {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "check";
            cmd.desc = "verify that a tag file decodes within the limits of a profile";
            cmd.args.expect({ "<file>" });
            add_decode_options(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            const auto bytes = file::read(path);
            auto lim = make_limiter(opts);
            nbt::buffer_input in { bytes };
            std::optional<nbt::named_node> res {};
            try {
                res = nbt::decode(in, lim, framing_option(opts, "framing"));
            } catch (const nbt::limit_error &ex) {
                throw error(fmt::format("{}: the limits are exceeded", path), ex);
            } catch (const nbt::unknown_type_error &ex) {
                throw error(fmt::format("{}: an unknown type", path), ex);
            } catch (const nbt::malformed_error &ex) {
                throw error(fmt::format("{}: malformed input", path), ex);
            } catch (const nbt::incomplete_error &ex) {
                throw error(fmt::format("{}: truncated input", path), ex);
            }
            if (in.remaining())
                logger::warn("{}: {} trailing bytes after the root value", path, in.remaining());
            logger::info("{}: ok, root type: {}, consumed {} bytes, {}", path,
                res ? res->second.type() : nbt::tag_type::end, in.consumed(), lim);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
