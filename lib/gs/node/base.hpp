/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_NODE_BASE_HPP
#define GRAPH_SENTINEL_NODE_BASE_HPP

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <gs/container.hpp>
#include <gs/json.hpp>
#include <gs/miner/types.hpp>

namespace graph_sentinel::node {
    // The authoritative blockchain client cannot be reached or returned garbage
    struct node_error: error {
        using error::error;
    };

    // One block a miner is asked about
    struct challenge_sample {
        int64_t height = 0;
        json::object question {};
        std::string expected {};
    };

    struct challenge {
        vector<challenge_sample> samples {};

        // The body of the challenge synapse: the heights to check and one question per height
        json::object request() const;
    };

    // Answers may come as strings of any case or as bare numbers
    extern std::string normalize_answer(const json::value &v);
    // The data_samples array of a miner's reply or nullptr when it carries no answers
    extern const json::array *data_samples(const json::value &output);

    struct base {
        explicit base(uint64_t seed=std::random_device {}());
        virtual ~base() =default;

        miner::network_type network() const
        {
            return _network_impl();
        }

        int64_t current_block_height() const
        {
            return _guard("current_block_height", [&] { return _current_block_height_impl(); });
        }

        // num_samples distinct heights from [start_height, end_height] in ascending order
        challenge create_challenge(int64_t start_height, int64_t end_height, size_t num_samples) const;

        // True only when every sample has been answered correctly
        bool validate_challenge_response_output(const challenge &ch, const json::array &answers) const;
    protected:
        int64_t _uniform(int64_t min, int64_t max) const;
    private:
        mutable std::mutex _rnd_mutex {};
        mutable std::mt19937_64 _rnd;

        // Whatever goes wrong while talking to the node is a node_error
        template<typename F>
        auto _guard(const std::string_view op, const F &act) const -> decltype(act())
        {
            try {
                return act();
            } catch (const node_error &) {
                throw;
            } catch (const std::exception &ex) {
                throw node_error(fmt::format("{} node: {} failed", _network_impl(), op), ex);
            }
        }

        virtual miner::network_type _network_impl() const =0;
        virtual int64_t _current_block_height_impl() const =0;
        virtual challenge_sample _create_sample_impl(int64_t height) const =0;
        virtual bool _validate_sample_impl(const challenge_sample &sample, const json::value &answer) const;
    };
}

#endif // !GRAPH_SENTINEL_NODE_BASE_HPP
