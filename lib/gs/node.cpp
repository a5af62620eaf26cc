/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <cctype>
#include <cmath>
#include <gs/node.hpp>
#include <gs/node/bitcoin.hpp>
#include <gs/node/ethereum.hpp>

namespace graph_sentinel::node {
    std::string normalize_answer(const json::value &v)
    {
        switch (v.kind()) {
            case json::kind::string: {
                std::string_view sv { v.get_string() };
                while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
                    sv.remove_prefix(1);
                while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
                    sv.remove_suffix(1);
                std::string res { sv };
                std::transform(res.begin(), res.end(), res.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return res;
            }
            case json::kind::int64:
                return std::to_string(v.get_int64());
            case json::kind::uint64:
                return std::to_string(v.get_uint64());
            case json::kind::double_: {
                const auto d = v.get_double();
                if (std::trunc(d) == d && std::abs(d) < 9.0e15)
                    return std::to_string(static_cast<int64_t>(d));
                return json::serialize(v);
            }
            default:
                return json::serialize(v);
        }
    }

    const json::array *data_samples(const json::value &output)
    {
        const auto *obj = output.if_object();
        if (!obj)
            return nullptr;
        const auto it = obj->find("data_samples");
        if (it == obj->end())
            return nullptr;
        const auto *samples = it->value().if_array();
        if (!samples || samples->empty() || samples->front().is_null())
            return nullptr;
        return samples;
    }

    json::object challenge::request() const
    {
        json::array heights {};
        json::array questions {};
        for (const auto &s: samples) {
            heights.emplace_back(s.height);
            questions.emplace_back(s.question);
        }
        return json::object {
            { "blocks_to_check", std::move(heights) },
            { "samples", std::move(questions) }
        };
    }

    base::base(const uint64_t seed)
        : _rnd { seed }
    {
    }

    challenge base::create_challenge(const int64_t start_height, const int64_t end_height, const size_t num_samples) const
    {
        if (start_height > end_height || num_samples == 0 || static_cast<uint64_t>(end_height - start_height) + 1 < num_samples)
            throw error(fmt::format("cannot sample {} distinct blocks from [{}, {}]", num_samples, start_height, end_height));
        // Floyd's sampling: exactly num_samples distinct heights without materializing the range
        set<int64_t> heights {};
        for (auto j = end_height - static_cast<int64_t>(num_samples) + 1; j <= end_height; ++j) {
            if (!heights.emplace(_uniform(start_height, j)).second)
                heights.emplace(j);
        }
        challenge ch {};
        ch.samples.reserve(num_samples);
        for (const auto h: heights)
            ch.samples.emplace_back(_guard("create_challenge", [&] { return _create_sample_impl(h); }));
        return ch;
    }

    bool base::validate_challenge_response_output(const challenge &ch, const json::array &answers) const
    {
        if (answers.size() != ch.samples.size())
            return false;
        for (size_t i = 0; i < answers.size(); ++i) {
            if (!_validate_sample_impl(ch.samples[i], answers[i]))
                return false;
        }
        return true;
    }

    int64_t base::_uniform(const int64_t min, const int64_t max) const
    {
        std::scoped_lock lk { _rnd_mutex };
        return std::uniform_int_distribution<int64_t> { min, max }(_rnd);
    }

    bool base::_validate_sample_impl(const challenge_sample &sample, const json::value &answer) const
    {
        return normalize_answer(answer) == normalize_answer(json::value(sample.expected));
    }

    node_ptr make_node(const miner::network_type network, const std::string &rpc_url)
    {
        switch (network) {
            case miner::network_type::bitcoin: return std::make_unique<bitcoin>(rpc_url);
            case miner::network_type::ethereum: return std::make_unique<ethereum>(rpc_url);
            default: throw error(fmt::format("no node implementation for network {}", network));
        }
    }
}
