/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <limits>
#include <gs/logger.hpp>
#include <gs/validator/clustering.hpp>

namespace graph_sentinel::validator {
    namespace {
        double dist2(const point &a, const point &b)
        {
            const auto dx = a.first - b.first;
            const auto dy = a.second - b.second;
            return dx * dx + dy * dy;
        }

        size_t nearest(const point &p, const vector<point> &centers)
        {
            size_t best = 0;
            double best_d = std::numeric_limits<double>::max();
            for (size_t i = 0; i < centers.size(); ++i) {
                if (const auto d = dist2(p, centers[i]); d < best_d) {
                    best_d = d;
                    best = i;
                }
            }
            return best;
        }

        vector<point> seed_centers(const vector<point> &points, const size_t k, std::mt19937_64 &rnd)
        {
            vector<point> centers {};
            centers.reserve(k);
            centers.emplace_back(points[std::uniform_int_distribution<size_t> { 0, points.size() - 1 }(rnd)]);
            vector<double> d2(points.size());
            while (centers.size() < k) {
                double total = 0.0;
                for (size_t i = 0; i < points.size(); ++i) {
                    d2[i] = dist2(points[i], centers[nearest(points[i], centers)]);
                    total += d2[i];
                }
                // all remaining points coincide with a center
                if (total <= 0.0) {
                    centers.emplace_back(points[std::uniform_int_distribution<size_t> { 0, points.size() - 1 }(rnd)]);
                    continue;
                }
                auto target = std::uniform_real_distribution<double> { 0.0, total }(rnd);
                size_t idx = points.size() - 1;
                for (size_t i = 0; i < points.size(); ++i) {
                    if (d2[i] > 0.0 && target < d2[i]) {
                        idx = i;
                        break;
                    }
                    target -= d2[i];
                }
                centers.emplace_back(points[idx]);
            }
            return centers;
        }
    }

    vector<size_t> kmeans(const vector<point> &points, const size_t k, const uint64_t seed, const size_t max_iterations)
    {
        if (k == 0)
            throw clustering_error("the number of clusters must be positive");
        if (points.size() < k)
            throw clustering_error("cannot split {} points into {} clusters", points.size(), k);
        std::mt19937_64 rnd { seed };
        auto centers = seed_centers(points, k, rnd);
        vector<size_t> labels(points.size(), std::numeric_limits<size_t>::max());
        for (size_t iter = 0; iter < max_iterations; ++iter) {
            bool changed = false;
            for (size_t i = 0; i < points.size(); ++i) {
                if (const auto l = nearest(points[i], centers); l != labels[i]) {
                    labels[i] = l;
                    changed = true;
                }
            }
            if (!changed)
                break;
            vector<point> sums(k, point { 0.0, 0.0 });
            vector<size_t> counts(k, 0);
            for (size_t i = 0; i < points.size(); ++i) {
                sums[labels[i]].first += points[i].first;
                sums[labels[i]].second += points[i].second;
                ++counts[labels[i]];
            }
            // an empty cluster keeps its previous center
            for (size_t c = 0; c < k; ++c) {
                if (counts[c] > 0)
                    centers[c] = point { sums[c].first / counts[c], sums[c].second / counts[c] };
            }
        }
        return labels;
    }

    vector<cluster_group> build_clusters(const vector<miner::miner_claim> &claims, const size_t num_clusters, const size_t chunk_size, std::mt19937_64 &rnd)
    {
        if (chunk_size == 0)
            throw error("chunk_size must be positive");
        if (claims.empty())
            throw clustering_error("no claims to cluster");
        vector<point> points {};
        points.reserve(claims.size());
        for (const auto &c: claims) {
            if (c.network != claims.front().network)
                throw error(fmt::format("cannot cluster claims of networks {} and {} together", c.network, claims.front().network));
            points.emplace_back(static_cast<double>(c.start_height), static_cast<double>(c.end_height));
        }
        const auto labels = kmeans(points, num_clusters, rnd());
        map<size_t, vector<miner::miner_claim>> members {};
        for (size_t i = 0; i < claims.size(); ++i)
            members[labels[i]].emplace_back(claims[i]);
        vector<cluster_group> groups {};
        for (auto &[label, group_claims]: members) {
            cluster_group g { claims.front().network, label };
            g.common_start = std::numeric_limits<int64_t>::max();
            g.common_end = std::numeric_limits<int64_t>::max();
            for (const auto &c: group_claims) {
                g.common_start = std::min(g.common_start, c.start_height);
                g.common_end = std::min(g.common_end, c.end_height);
            }
            std::shuffle(group_claims.begin(), group_claims.end(), rnd);
            for (size_t off = 0; off < group_claims.size(); off += chunk_size) {
                const auto end = std::min(off + chunk_size, group_claims.size());
                g.chunks.emplace_back(group_claims.begin() + off, group_claims.begin() + end);
            }
            logger::debug("{} cluster {}: {} miners over [{}, {}] in {} chunks", g.network, label, group_claims.size(),
                g.common_start, g.common_end, g.chunks.size());
            groups.emplace_back(std::move(g));
        }
        return groups;
    }
}
