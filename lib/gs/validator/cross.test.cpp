/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <mutex>
#include <gs/test.hpp>
#include <gs/validator/cross.hpp>
#include <gs/validator/mocks.hpp>

using namespace graph_sentinel;
using namespace graph_sentinel::validator;

namespace {
    transport::response honest_answer(const miner::miner_info &, const transport::synapse &syn)
    {
        return transport_mock::ok(node_mock::answers(syn));
    }

    vector<int64_t> requested_heights(const transport::synapse &syn)
    {
        vector<int64_t> heights {};
        for (const auto &h: syn.body.at("blocks_to_check").as_array())
            heights.emplace_back(h.to_number<int64_t>());
        return heights;
    }
}

suite validator_cross_suite = [] {
    "validator::cross"_test = [] {
        const miner::miner_info m { 1, "hk-1", "", "10.0.0.1", 8091 };
        const cross_check_options opts { 20, 3, std::chrono::seconds { 1 } };

        "check_range"_test = [] {
            expect(!check_range(1, 1000, 1000, 20, 3));
            expect(!check_range(981, 1000, 1000, 20, 3));
            expect(!!check_range(982, 1000, 1000, 20, 3));
            expect(!check_range(1, 1003, 1000, 20, 3));
            expect(!!check_range(1, 1004, 1000, 20, 3));
            expect(!!check_range(0, 1000, 1000, 20, 3));
            expect(!!check_range(500, 500, 1000, 1, 3));
            expect(!!check_range(600, 500, 1000, 1, 3));
        };
        "pass"_test = [&] {
            const transport_mock client { honest_answer };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            const auto res = cross_validate(client, m, node, 1, 1000, opts);
            expect(res.outcome == cross_check_outcome::pass) << res.reason;
            test_same(1, client.calls("Challenge"));
            test_same(20, node.sample_calls());
        };
        "distinct sampled blocks"_test = [&] {
            std::mutex heights_mutex {};
            vector<int64_t> heights {};
            const transport_mock client { [&](const auto &, const auto &syn) {
                std::scoped_lock lk { heights_mutex };
                heights = requested_heights(syn);
                test_same(heights.size(), syn.body.at("samples").as_array().size());
                return transport_mock::ok(node_mock::answers(syn));
            } };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            expect(cross_validate(client, m, node, 1, 1000, opts).outcome == cross_check_outcome::pass);
            test_same(20, heights.size());
            test_same(20, set<int64_t>(heights.begin(), heights.end()).size());
            expect(std::is_sorted(heights.begin(), heights.end()));
            expect(heights.front() >= 1);
            expect(heights.back() <= 1000);
        };
        "narrow known range samples every block"_test = [&] {
            vector<int64_t> heights {};
            const transport_mock client { [&](const auto &, const auto &syn) {
                heights = requested_heights(syn);
                return transport_mock::ok(node_mock::answers(syn));
            } };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            expect(cross_validate(client, m, node, 985, 1003, { 19, 3, std::chrono::seconds { 1 } }).outcome == cross_check_outcome::pass);
            test_same(16, heights.size());
            test_same(985, heights.front());
            test_same(1000, heights.back());
        };
        "pass within the lookahead tolerance"_test = [&] {
            const transport_mock client { honest_answer };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            const auto res = cross_validate(client, m, node, 1, 1002, opts);
            expect(res.outcome == cross_check_outcome::pass) << res.reason;
        };
        "wrong answer"_test = [&] {
            const transport_mock client { [](const auto &, const auto &syn) {
                return transport_mock::ok(node_mock::answers(syn, [](int64_t) { return std::string { "tx-0" }; }));
            } };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            const auto res = cross_validate(client, m, node, 1, 1000, opts);
            expect(res.outcome == cross_check_outcome::fail);
        };
        "one wrong answer among twenty"_test = [&] {
            const transport_mock client { [](const auto &, const auto &syn) {
                const auto heights = requested_heights(syn);
                const auto last = heights.back();
                return transport_mock::ok(node_mock::answers(syn, [last](const int64_t h) {
                    return h == last ? std::string { "tx-0" } : node_mock::answer(h);
                }));
            } };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            const auto res = cross_validate(client, m, node, 1, 1000, opts);
            expect(res.outcome == cross_check_outcome::fail);
            test_same(1, client.calls("Challenge"));
            test_same(20, node.sample_calls());
        };
        "fewer answers than blocks"_test = [&] {
            const transport_mock client { [](const auto &, const auto &syn) {
                auto out = node_mock::answers(syn);
                out.as_object().at("data_samples").as_array().pop_back();
                return transport_mock::ok(std::move(out));
            } };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            expect(cross_validate(client, m, node, 1, 1000, opts).outcome == cross_check_outcome::fail);
        };
        "reply without data samples"_test = [&] {
            const node_mock node { miner::network_type::bitcoin, 1000 };
            for (const auto &out: { json::value(json::object {}), json::value(json::object { { "data_samples", json::array {} } }),
                    json::value("tx-1"), json::value(json::object { { "data_samples", json::array { nullptr } } }) }) {
                const transport_mock client { [&](const auto &, const auto &) { return transport_mock::ok(out); } };
                expect(cross_validate(client, m, node, 1, 1000, opts).outcome == cross_check_outcome::indeterminate);
            }
        };
        "case and whitespace do not matter"_test = [&] {
            const transport_mock client { [](const auto &, const auto &syn) {
                return transport_mock::ok(node_mock::answers(syn, [](const int64_t h) { return fmt::format("  TX-{} ", h); }));
            } };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            expect(cross_validate(client, m, node, 1, 1000, opts).outcome == cross_check_outcome::pass);
        };
        "no answer"_test = [&] {
            const transport_mock client { [](const auto &, const auto &) { return transport_mock::timeout(); } };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            const auto res = cross_validate(client, m, node, 1, 1000, opts);
            expect(res.outcome == cross_check_outcome::indeterminate);
        };
        "malformed range costs nothing"_test = [&] {
            const transport_mock client { honest_answer };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            expect(cross_validate(client, m, node, 990, 1000, opts).outcome == cross_check_outcome::fail);
            expect(cross_validate(client, m, node, 0, 1000, opts).outcome == cross_check_outcome::fail);
            test_same(0, node.height_calls());
            test_same(0, node.sample_calls());
            test_same(0, client.calls());
        };
        "ahead of the tip"_test = [&] {
            const transport_mock client { honest_answer };
            const node_mock node { miner::network_type::bitcoin, 1000 };
            expect(cross_validate(client, m, node, 1, 2000, opts).outcome == cross_check_outcome::fail);
            test_same(1, node.height_calls());
            test_same(0, client.calls());
        };
        "node failure propagates"_test = [&] {
            const transport_mock client { honest_answer };
            node_mock node { miner::network_type::bitcoin, 1000 };
            node.fail_challenge = true;
            expect(throws<node::node_error>([&] { cross_validate(client, m, node, 1, 1000, opts); }));
            test_same(0, client.calls());
        };
    };
};
