/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <cmath>
#include <gs/logger.hpp>
#include <gs/validator/scorer.hpp>

namespace graph_sentinel::validator {
    network_distribution make_distribution(const miner::network_type network, const vector<miner::miner_claim> &claims,
        const size_t num_networks, const int64_t tip, const double recent_range)
    {
        network_distribution dist {};
        dist.total_miners = claims.size();
        dist.num_networks = std::max(num_networks, size_t { 1 });
        for (const auto &c: claims) {
            if (c.network != network)
                continue;
            ++dist.network_miners;
            if (static_cast<double>(tip - c.end_height) <= recent_range)
                ++dist.recent_miners;
        }
        return dist;
    }

    scorer::scorer(const score_weights &weights)
        : _w { weights }
    {
        _w.validate();
    }

    double scorer::coverage_factor(const int64_t claimed_start, const int64_t claimed_end, const int64_t authoritative_height) const
    {
        if (authoritative_height <= 0)
            return 0.0;
        const auto covered = std::min(claimed_end, authoritative_height) - claimed_start + 1;
        if (covered <= 0)
            return 0.0;
        return std::clamp(static_cast<double>(covered) / static_cast<double>(authoritative_height), 0.0, 1.0);
    }

    double scorer::recency_factor(const int64_t claimed_end, const int64_t authoritative_height) const
    {
        const auto gap = static_cast<double>(std::max(authoritative_height - claimed_end, int64_t { 0 }));
        return _w.recency_scale / (_w.recency_scale + gap);
    }

    double scorer::timeliness_factor(const double response_time) const
    {
        return 1.0 / (1.0 + std::max(response_time, 0.0) / _w.response_time_scale);
    }

    double scorer::distribution_factor(const network_distribution &dist) const
    {
        double over = 0.0;
        if (dist.total_miners > 0 && dist.num_networks > 1) {
            const auto fair = 1.0 / static_cast<double>(dist.num_networks);
            const auto share = static_cast<double>(dist.network_miners) / static_cast<double>(dist.total_miners);
            over = std::clamp((share - fair) / (1.0 - fair), 0.0, 1.0);
        }
        double crowding = 0.0;
        if (dist.network_miners > 0)
            crowding = std::clamp(static_cast<double>(dist.recent_miners) / static_cast<double>(dist.network_miners), 0.0, 1.0);
        const auto sharing = 1.0 / static_cast<double>(std::max(dist.same_source_miners, size_t { 1 }));
        return (1.0 - over) * (1.0 - max_crowding_penalty * crowding) * sharing;
    }

    double scorer::uptime_factor(const double uptime_average) const
    {
        return _w.uptime_floor + (1.0 - _w.uptime_floor) * std::clamp(uptime_average, 0.0, 1.0);
    }

    double scorer::calculate_score(const miner::network_type network, const double adjusted_response_time, const int64_t claimed_start,
        const int64_t claimed_end, const int64_t authoritative_height, const network_distribution &dist, const double uptime_average) const
    {
        if (std::isnan(adjusted_response_time) || std::isnan(uptime_average) || adjusted_response_time < 0.0 || uptime_average < 0.0) {
            logger::warn("{}: refusing to score invalid inputs: time {} uptime {}", network, adjusted_response_time, uptime_average);
            return 0.0;
        }
        const auto total_weight = _w.coverage + _w.recency + _w.timeliness + _w.distribution;
        const auto base = (_w.coverage * coverage_factor(claimed_start, claimed_end, authoritative_height)
            + _w.recency * recency_factor(claimed_end, authoritative_height)
            + _w.timeliness * timeliness_factor(adjusted_response_time)
            + _w.distribution * distribution_factor(dist)) / total_weight;
        const auto score = base * uptime_factor(uptime_average);
        if (std::isnan(score))
            return 0.0;
        return std::clamp(score, 0.0, 1.0);
    }
}
