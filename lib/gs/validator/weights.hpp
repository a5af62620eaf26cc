/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_VALIDATOR_WEIGHTS_HPP
#define GRAPH_SENTINEL_VALIDATOR_WEIGHTS_HPP

#include <string>
#include <gs/container.hpp>
#include <gs/json.hpp>

namespace graph_sentinel::validator {
    struct reward {
        uint64_t uid = 0;
        std::string hotkey {};
        double score = 0.0;
    };
    using reward_list = vector<reward>;

    struct reward_sink {
        virtual ~reward_sink() =default;

        // Scores outside of [0, 1] are rejected as a whole
        void update(const reward_list &rewards)
        {
            for (const auto &r: rewards) {
                if (!(r.score >= 0.0 && r.score <= 1.0))
                    throw error(fmt::format("reward for uid {} is outside of [0, 1]: {}", r.uid, r.score));
            }
            _update_impl(rewards);
        }
    private:
        virtual void _update_impl(const reward_list &rewards) =0;
    };

    // w = alpha * reward + (1 - alpha) * w for each rewarded uid
    struct ema_weights: reward_sink {
        using weight_map = map<uint64_t, double>;

        explicit ema_weights(double alpha=0.9);

        double alpha() const
        {
            return _alpha;
        }

        double weight(uint64_t uid) const;

        const weight_map &weights() const
        {
            return _weights;
        }

        json::object to_json() const;
        void load(const std::string &path);
        void save(const std::string &path) const;
    private:
        double _alpha;
        weight_map _weights {};

        void _update_impl(const reward_list &rewards) override;
    };
}

#endif // !GRAPH_SENTINEL_VALIDATOR_WEIGHTS_HPP
