/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <charconv>
#include <random>
#include <gs/cli.hpp>
#include <gs/miner/metadata.hpp>
#include <gs/node.hpp>
#include <gs/transport/http.hpp>
#include <gs/validator/round.hpp>

namespace graph_sentinel::cli::validate {
    static std::optional<std::string> validate_count(const std::optional<std::string> &val)
    {
        if (!val)
            return "a value is required";
        uint64_t v = 0;
        const auto [ptr, ec] = std::from_chars(val->data(), val->data() + val->size(), v);
        if (ec != std::errc {} || ptr != val->data() + val->size())
            return "must be a non-negative integer";
        return {};
    }

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "validate";
            cmd.desc = "run validation rounds against the miners of a network snapshot and update their weights";
            cmd.args.expect({ "<miners.json>", "<metadata.json>" });
            cmd.opts.try_emplace("rounds", option_config { "the number of rounds to run", "1", validate_count });
            cmd.opts.try_emplace("seed", option_config { "the seed of the first round, later rounds use the following ones", {}, validate_count });
            cmd.opts.try_emplace("weights", option_config { "a JSON file with the persisted weights", "./data/weights.json" });
            cmd.opts.try_emplace("hotkey", option_config { "the validator hotkey announced to miners", "" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto cfg = validator::validator_config::from(configs_dir::get());
            const auto miners = miner::load_miners(args.at(0));
            const miner::metadata_source_file meta_src { args.at(1) };
            const auto num_rounds = std::stoull(*opts.at("rounds"));
            uint64_t seed = std::random_device {}();
            if (const auto it = opts.find("seed"); it != opts.end() && it->second)
                seed = std::stoull(*it->second);
            const auto &weights_path = *opts.at("weights");

            node::node_set nodes {};
            for (const auto n: cfg.networks)
                nodes.emplace(n, node::make_node(n, cfg.network(n).rpc_url));
            const transport::http_client client { *opts.at("hotkey") };
            validator::uptime_store_sqlite uptime { cfg.uptime_db, cfg.uptime_window };
            const validator::scorer score { cfg.score };
            validator::ema_weights weights { cfg.alpha };
            weights.load(weights_path);
            scheduler sched { cfg.worker_count };
            validator::round_driver driver { client, nodes, uptime, score, weights, cfg, sched };
            driver.init();

            const miner::fetch_options fetch_opts { cfg.metadata_retries, cfg.metadata_backoff, std::min(cfg.worker_count, size_t { 3 }) };
            for (uint64_t r = 0; r < num_rounds; ++r) {
                driver.sync();
                const validator::round_input input { miners, miner::fetch_metadata(meta_src, miners, fetch_opts), seed + r };
                const auto res = driver.run_round(input);
                weights.save(weights_path);
                logger::info("round {} of {} complete: {} miners reported, {} rewarded", r + 1, num_rounds, res.reports.size(), res.rewards.size());
            }
            for (const auto &[uid, w]: weights.weights())
                logger::info("uid {} weight {:0.4f}", uid, w);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
