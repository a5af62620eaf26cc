/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_VALIDATOR_BENCHMARK_HPP
#define GRAPH_SENTINEL_VALIDATOR_BENCHMARK_HPP

#include <optional>
#include <random>
#include <string>
#include <gs/scheduler.hpp>
#include <gs/transport.hpp>
#include <gs/validator/clustering.hpp>
#include <gs/validator/config.hpp>

namespace graph_sentinel::validator {
    struct benchmark_outcome {
        miner::miner_info miner {};
        miner::network_type network = miner::network_type::bitcoin;
        double response_time = 0.0;
        std::optional<json::value> output {};
        bool agrees_with_majority = false;
    };

    struct benchmark_report {
        vector<benchmark_outcome> outcomes {};
        vector<miner::network_type> skipped_networks {};
        // members of chunks where nobody responded
        vector<miner::miner_info> vacant {};
    };

    // Substitutes {start}, {end} and {diff} in a query template
    extern std::string render_query(std::string_view tmpl, int64_t start, int64_t end, int64_t diff);

    // The most common value wins; an exact tie goes to the value seen first
    extern size_t majority_index(const vector<std::string> &values);

    struct benchmark_engine {
        benchmark_engine(const transport::client &client, scheduler &sched, const validator_config &cfg);
        benchmark_report run(const vector<miner::miner_claim> &claims, std::mt19937_64 &rnd) const;
    private:
        const transport::client &_client;
        scheduler &_sched;
        const validator_config &_cfg;
    };
}

#endif // !GRAPH_SENTINEL_VALIDATOR_BENCHMARK_HPP
