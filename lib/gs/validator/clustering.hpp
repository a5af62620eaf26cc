/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_VALIDATOR_CLUSTERING_HPP
#define GRAPH_SENTINEL_VALIDATOR_CLUSTERING_HPP

#include <random>
#include <gs/container.hpp>
#include <gs/miner/types.hpp>

namespace graph_sentinel::validator {
    struct clustering_error: error {
        using error::error;
    };

    using point = std::pair<double, double>;

    // Lloyd's algorithm with k-means++ seeding. The same seed always yields the same labels.
    extern vector<size_t> kmeans(const vector<point> &points, size_t k, uint64_t seed, size_t max_iterations=300);

    // Miners assumed to cover the same range, split into chunks that are queried together
    struct cluster_group {
        miner::network_type network = miner::network_type::bitcoin;
        size_t label = 0;
        int64_t common_start = 0;
        int64_t common_end = 0;
        vector<vector<miner::miner_claim>> chunks {};

        size_t size() const
        {
            size_t sz = 0;
            for (const auto &c: chunks)
                sz += c.size();
            return sz;
        }
    };

    // All claims must belong to the same network. Throws clustering_error when there are fewer claims than clusters.
    extern vector<cluster_group> build_clusters(const vector<miner::miner_claim> &claims, size_t num_clusters, size_t chunk_size, std::mt19937_64 &rnd);
}

#endif // !GRAPH_SENTINEL_VALIDATOR_CLUSTERING_HPP
