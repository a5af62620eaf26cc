/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_VALIDATOR_ROUND_HPP
#define GRAPH_SENTINEL_VALIDATOR_ROUND_HPP

#include <optional>
#include <gs/miner/metadata.hpp>
#include <gs/node.hpp>
#include <gs/scheduler.hpp>
#include <gs/transport.hpp>
#include <gs/validator/benchmark.hpp>
#include <gs/validator/cross.hpp>
#include <gs/validator/response.hpp>
#include <gs/validator/scorer.hpp>
#include <gs/validator/uptime.hpp>
#include <gs/validator/weights.hpp>

namespace graph_sentinel::validator {
    // The furthest pipeline stage a miner reached in a round
    enum class miner_stage: uint8_t {
        discovery, cross_validation, benchmark, scored
    };

    struct miner_report {
        miner::miner_info miner {};
        miner_stage stage = miner_stage::discovery;
        verdict validation {};
        std::optional<cross_check_result> cross_check {};
        std::optional<benchmark_outcome> benchmark {};
        std::optional<double> reward {};
        // empty when the round made no uptime observation for the miner
        std::optional<bool> uptime_up {};
        std::string note {};
    };

    // An immutable snapshot of everything a round depends on
    struct round_input {
        vector<miner::miner_info> miners {};
        miner::metadata_map metadata {};
        uint64_t seed = 0;
    };

    struct round_result {
        vector<miner_report> reports {};
        reward_list rewards {};
    };

    struct round_driver {
        round_driver(const transport::client &client, const node::node_set &nodes, uptime_store &uptime, const scorer &score,
            reward_sink &sink, const validator_config &cfg, scheduler &sched);

        // Throws fatal_error when this validator cannot take part in the network
        void init(uint64_t own_version=protocol_version) const;
        // Refreshes the authoritative heights; a network whose node fails sits out until the next sync
        void sync();
        round_result run_round(const round_input &input);

        const map<miner::network_type, int64_t> &heights() const
        {
            return _heights;
        }
    private:
        const transport::client &_client;
        const node::node_set &_nodes;
        uptime_store &_uptime;
        const scorer &_scorer;
        reward_sink &_sink;
        const validator_config &_cfg;
        scheduler &_sched;
        map<miner::network_type, int64_t> _heights {};

        void _discover(vector<miner_report> &reports, vector<double> &latencies, const validation_context &ctx);
        void _cross_validate(vector<miner_report> &reports);
        void _benchmark(vector<miner_report> &reports, std::mt19937_64 &rnd);
        void _record_uptime(const vector<miner_report> &reports);
        void _score(vector<miner_report> &reports, const vector<double> &latencies, const validation_context &ctx) const;
    };
}

namespace fmt {
    template<>
    struct formatter<graph_sentinel::validator::miner_stage>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using graph_sentinel::validator::miner_stage;
            switch (v) {
                case miner_stage::discovery: return fmt::format_to(ctx.out(), "discovery");
                case miner_stage::cross_validation: return fmt::format_to(ctx.out(), "cross_validation");
                case miner_stage::benchmark: return fmt::format_to(ctx.out(), "benchmark");
                case miner_stage::scored: return fmt::format_to(ctx.out(), "scored");
                default: throw graph_sentinel::error(fmt::format("unsupported miner_stage value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !GRAPH_SENTINEL_VALIDATOR_ROUND_HPP
