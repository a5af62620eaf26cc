/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <gs/cli.hpp>
#include <gs/validator/config.hpp>
#include <gs/validator/uptime.hpp>

namespace graph_sentinel::cli::uptime {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "uptime";
            cmd.desc = "show the uptime scores of the given miners from the durable store";
            cmd.args.expect({ "<hotkey>", "[<hotkey>...]" });
        }

        void run(const arguments &args, const options &) const override
        {
            const auto cfg = validator::validator_config::from(configs_dir::get());
            const validator::uptime_store_sqlite store { cfg.uptime_db, cfg.uptime_window };
            for (const auto &hotkey: args) {
                const auto s = store.scores(hotkey);
                std::cout << fmt::format("{}: average: {:0.3f} consecutive up: {} consecutive down: {} observations: {}\n",
                    hotkey, s.average, s.consecutive_up, s.consecutive_down, s.observations);
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
