/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_VALIDATOR_CONFIG_HPP
#define GRAPH_SENTINEL_VALIDATOR_CONFIG_HPP

#include <chrono>
#include <string>
#include <gs/config.hpp>
#include <gs/container.hpp>
#include <gs/miner/types.hpp>

namespace graph_sentinel::validator {
    // The protocol version spoken by this validator
    static constexpr uint64_t protocol_version = 5;

    struct score_weights {
        double coverage = 0.35;
        double recency = 0.15;
        double timeliness = 0.3;
        double distribution = 0.2;
        // response time in seconds at which the timeliness factor halves
        double response_time_scale = 10.0;
        // blocks behind the tip at which the recency factor halves
        double recency_scale = 1000.0;
        // claims ending within this many blocks of the tip count as recent
        double recent_range = 1000.0;
        double uptime_floor = 0.1;

        static score_weights from_json(const json::object &o);
        void validate() const;
    };

    struct network_config {
        std::string rpc_url {};
        int64_t min_range_size = 20;
        std::string benchmark_query {};
    };

    struct validator_config {
        using seconds = std::chrono::seconds;
        using milliseconds = std::chrono::milliseconds;

        vector<miner::network_type> networks { miner::network_type::bitcoin };
        map<miner::network_type, network_config> network_configs {};
        size_t sample_size = 16;
        size_t worker_count = 3;
        milliseconds discovery_timeout = seconds { 100 };
        milliseconds challenge_timeout = seconds { 100 };
        milliseconds benchmark_timeout = seconds { 600 };
        size_t max_multiple_ips = 1;
        size_t max_multiple_run_ids = 1;
        size_t benchmark_cluster_count = 5;
        size_t benchmark_chunk_size = 16;
        int64_t benchmark_diff_min = 1;
        int64_t benchmark_diff_max = 1000;
        int64_t lookahead_tolerance = 3;
        size_t uptime_window = 100;
        std::string uptime_db { "./data/uptime.sqlite" };
        double alpha = 0.9;
        bool grace_period = false;
        double grace_threshold_score = 0.0;
        uint64_t required_version = protocol_version;
        bool enforce_upgrade = false;
        size_t metadata_retries = 5;
        milliseconds metadata_backoff { 1000 };
        score_weights score {};

        static validator_config from_json(const json::object &o);

        static validator_config from(const configs &cfg)
        {
            return from_json(cfg.at("validator").json());
        }

        const network_config &network(miner::network_type n) const;
        void validate() const;
    };

    extern std::string default_benchmark_query(miner::network_type n);
}

#endif // !GRAPH_SENTINEL_VALIDATOR_CONFIG_HPP
