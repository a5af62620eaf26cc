/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_VALIDATOR_SCORER_HPP
#define GRAPH_SENTINEL_VALIDATOR_SCORER_HPP

#include <gs/miner/types.hpp>
#include <gs/validator/config.hpp>

namespace graph_sentinel::validator {
    // Over-representation signals for the network of a scored miner
    struct network_distribution {
        size_t network_miners = 0;
        size_t total_miners = 0;
        size_t num_networks = 1;
        // miners of the network whose claims end close to the tip
        size_t recent_miners = 0;
        // hotkeys sharing the scored miner's address or owner, itself included
        size_t same_source_miners = 1;
    };

    extern network_distribution make_distribution(miner::network_type network, const vector<miner::miner_claim> &claims,
        size_t num_networks, int64_t tip, double recent_range);

    struct scorer {
        static constexpr double max_crowding_penalty = 0.5;

        explicit scorer(const score_weights &weights);

        // Pure: identical inputs always give an identical result within [0, 1]
        double calculate_score(miner::network_type network, double adjusted_response_time, int64_t claimed_start, int64_t claimed_end,
            int64_t authoritative_height, const network_distribution &dist, double uptime_average) const;

        double coverage_factor(int64_t claimed_start, int64_t claimed_end, int64_t authoritative_height) const;
        double recency_factor(int64_t claimed_end, int64_t authoritative_height) const;
        double timeliness_factor(double response_time) const;
        double distribution_factor(const network_distribution &dist) const;
        double uptime_factor(double uptime_average) const;
    private:
        score_weights _w;
    };
}

#endif // !GRAPH_SENTINEL_VALIDATOR_SCORER_HPP
