/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_VALIDATOR_MOCKS_HPP
#define GRAPH_SENTINEL_VALIDATOR_MOCKS_HPP

#include <atomic>
#include <functional>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <gs/miner/metadata.hpp>
#include <gs/node/base.hpp>
#include <gs/transport.hpp>

namespace graph_sentinel::validator {
    // Answers queries with a user-supplied handler; the handler is called from worker threads
    struct transport_mock: transport::client {
        using handler = std::function<transport::response (const miner::miner_info &, const transport::synapse &)>;

        static transport::response ok(json::value output, const double process_time=0.1)
        {
            transport::response r {};
            r.output = std::move(output);
            r.status_code = 200;
            r.process_time = process_time;
            return r;
        }

        static transport::response timeout()
        {
            transport::response r {};
            r.status_code = 408;
            r.is_timeout = true;
            return r;
        }

        static transport::response failure(const unsigned status=503)
        {
            transport::response r {};
            r.status_code = status;
            r.is_failure = true;
            return r;
        }

        explicit transport_mock(handler h)
            : _handler { std::move(h) }
        {
        }

        // the number of queries of the named synapse, all queries when the name is empty
        size_t calls(const std::string &name={}) const
        {
            std::scoped_lock lk { _calls_mutex };
            if (name.empty()) {
                size_t total = 0;
                for (const auto &[n, cnt]: _calls)
                    total += cnt;
                return total;
            }
            const auto it = _calls.find(name);
            return it != _calls.end() ? it->second : 0;
        }
    private:
        handler _handler;
        mutable std::mutex _calls_mutex {};
        mutable map<std::string, size_t> _calls {};

        transport::response _query_impl(const miner::miner_info &target, const transport::synapse &syn, std::chrono::milliseconds) const override
        {
            {
                std::scoped_lock lk { _calls_mutex };
                ++_calls[syn.name];
            }
            return _handler(target, syn);
        }
    };

    // Expects the answer "tx-<height>" for every sampled block
    struct node_mock: node::base {
        std::atomic_bool fail_height { false };
        std::atomic_bool fail_challenge { false };
        // samples at or above this height fail with an error that is not a node_error
        std::atomic<int64_t> malformed_from { std::numeric_limits<int64_t>::max() };
        std::atomic<int64_t> height;

        static std::string answer(const int64_t height)
        {
            return fmt::format("tx-{}", height);
        }

        // A reply to a Challenge synapse answering each requested block with answer_of(height)
        static json::value answers(const transport::synapse &syn, const std::function<std::string (int64_t)> &answer_of=answer)
        {
            json::array samples {};
            for (const auto &h: syn.body.at("blocks_to_check").as_array())
                samples.emplace_back(answer_of(h.to_number<int64_t>()));
            return json::object { { "data_samples", std::move(samples) } };
        }

        node_mock(const miner::network_type network, const int64_t tip, const uint64_t seed=42)
            : node::base { seed }, height { tip }, _network { network }
        {
        }

        size_t height_calls() const
        {
            return _height_calls.load();
        }

        size_t sample_calls() const
        {
            return _sample_calls.load();
        }
    private:
        miner::network_type _network;
        mutable std::atomic_size_t _height_calls { 0 };
        mutable std::atomic_size_t _sample_calls { 0 };

        miner::network_type _network_impl() const override
        {
            return _network;
        }

        int64_t _current_block_height_impl() const override
        {
            ++_height_calls;
            if (fail_height)
                throw node::node_error(fmt::format("{} node is unreachable", _network));
            return height;
        }

        node::challenge_sample _create_sample_impl(const int64_t h) const override
        {
            ++_sample_calls;
            if (fail_challenge)
                throw node::node_error(fmt::format("{} node failed to create a challenge", _network));
            if (h >= malformed_from)
                throw std::runtime_error(fmt::format("block {} has an unexpected layout", h));
            return { h, json::object { { "kind", "mock" }, { "block_height", h } }, answer(h) };
        }
    };

    struct metadata_source_mock: miner::metadata_source {
        map<std::string, std::string> commitments {};
        // the number of transient failures before a hotkey's commitment is returned
        mutable map<std::string, size_t> transient_failures {};
        set<std::string> broken {};

        size_t calls() const
        {
            return _calls.load();
        }
    private:
        mutable std::mutex _failures_mutex {};
        mutable std::atomic_size_t _calls { 0 };

        std::optional<std::string> _commitment_impl(const std::string &hotkey) const override
        {
            ++_calls;
            if (broken.contains(hotkey))
                throw error(fmt::format("the commitment of {} is unreadable", hotkey));
            {
                std::scoped_lock lk { _failures_mutex };
                if (const auto it = transient_failures.find(hotkey); it != transient_failures.end() && it->second > 0) {
                    --it->second;
                    throw miner::metadata_transient_error(fmt::format("connection to the metadata source dropped for {}", hotkey));
                }
            }
            if (const auto it = commitments.find(hotkey); it != commitments.end())
                return it->second;
            return {};
        }
    };
}

#endif // !GRAPH_SENTINEL_VALIDATOR_MOCKS_HPP
