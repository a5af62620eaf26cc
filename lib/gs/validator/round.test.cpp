/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <gs/test.hpp>
#include <gs/validator/mocks.hpp>
#include <gs/validator/round.hpp>

using namespace graph_sentinel;
using namespace graph_sentinel::validator;

namespace {
    json::value discovery_output(const int64_t start, const int64_t end, const uint64_t version=protocol_version)
    {
        return json::object {
            { "metadata", json::object { { "network", "bitcoin" }, { "model_type", "funds_flow" } } },
            { "start_block_height", start },
            { "block_height", end },
            { "version", version }
        };
    }

    transport::response honest(const miner::miner_info &, const transport::synapse &syn)
    {
        if (syn.name == "Discovery")
            return transport_mock::ok(discovery_output(1, 1000), 0.5);
        if (syn.name == "Challenge")
            return transport_mock::ok(node_mock::answers(syn), 0.2);
        return transport_mock::ok(json::value("A"), 1.5);
    }

    struct round_fixture {
        validator_config cfg;
        node::node_set nodes {};
        node_mock *btc = nullptr;
        uptime_store_memory uptime { 10 };
        scorer score;
        ema_weights weights { 0.5 };
        scheduler sched { 3 };
        vector<miner::miner_info> miners {};
        miner::metadata_map metadata {};

        explicit round_fixture(const json::object &overrides={})
            : cfg { make_config(overrides) }, score { cfg.score }
        {
            auto node = std::make_unique<node_mock>(miner::network_type::bitcoin, 1000);
            btc = node.get();
            nodes.emplace(miner::network_type::bitcoin, std::move(node));
        }

        void add_miners(const size_t num, const std::optional<std::string> &shared_ip={})
        {
            for (size_t i = 0; i < num; ++i) {
                const auto uid = miners.size() + 1;
                const auto hotkey = fmt::format("hk-{}", uid);
                miners.emplace_back(miner::miner_info { uid, hotkey, "", shared_ip.value_or(fmt::format("10.0.0.{}", uid)), 8091 });
                metadata.emplace(hotkey, miner::miner_metadata { 1, protocol_version, "img", 1, 1, fmt::format("run-{}", uid) });
            }
        }

        round_result run(const transport::client &client, const uint64_t seed=1)
        {
            round_driver driver { client, nodes, uptime, score, weights, cfg, sched };
            driver.init();
            driver.sync();
            return driver.run_round(round_input { miners, metadata, seed });
        }
    private:
        static validator_config make_config(const json::object &overrides)
        {
            json::object o {
                { "benchmark_cluster_count", 1 },
                { "benchmark_diff_min", 1 },
                { "benchmark_diff_max", 5 },
                { "uptime_window", 10 }
            };
            for (const auto &[k, v]: overrides)
                o[k] = v;
            return validator_config::from_json(o);
        }
    };

    const miner_report &report_of(const round_result &res, const std::string &hotkey)
    {
        for (const auto &r: res.reports) {
            if (r.miner.hotkey == hotkey)
                return r;
        }
        throw error(fmt::format("no report for {}", hotkey));
    }
}

suite validator_round_suite = [] {
    "validator::round"_test = [] {
        "one disagreeing miner"_test = [] {
            round_fixture f {};
            f.add_miners(5);
            const transport_mock client { [](const miner::miner_info &m, const transport::synapse &syn) {
                if (syn.name == "Benchmark" && m.hotkey == "hk-5")
                    return transport_mock::ok(json::value("B"), 1.5);
                return honest(m, syn);
            } };
            const auto res = f.run(client);
            test_same(5, res.reports.size());
            test_same(5, res.rewards.size());
            for (const auto &hk: { "hk-1", "hk-2", "hk-3", "hk-4" }) {
                const auto &r = report_of(res, hk);
                expect(r.stage == miner_stage::scored) << hk;
                expect(r.benchmark && r.benchmark->agrees_with_majority) << hk;
                expect(r.reward && *r.reward > 0.0 && *r.reward <= 1.0) << hk;
                test_same(1, f.uptime.scores(hk).consecutive_up);
                expect(f.weights.weight(r.miner.uid) > 0.0);
            }
            const auto &bad = report_of(res, "hk-5");
            expect(bad.stage == miner_stage::benchmark);
            expect(bad.benchmark && !bad.benchmark->agrees_with_majority);
            expect(bad.reward && *bad.reward == 0.0);
            test_same(1, f.uptime.scores("hk-5").consecutive_down);
            test_close(0.0, f.weights.weight(5));
            test_same(5, client.calls("Discovery"));
            test_same(5, client.calls("Challenge"));
            test_same(5, client.calls("Benchmark"));
        };
        "cross-validation outcomes"_test = [] {
            round_fixture f {};
            f.add_miners(3);
            const transport_mock client { [](const miner::miner_info &m, const transport::synapse &syn) {
                if (syn.name == "Challenge" && m.hotkey == "hk-2")
                    return transport_mock::ok(node_mock::answers(syn, [](int64_t) { return std::string { "tx-41" }; }));
                if (syn.name == "Challenge" && m.hotkey == "hk-3")
                    return transport_mock::timeout();
                return honest(m, syn);
            } };
            const auto res = f.run(client);
            const auto &pass = report_of(res, "hk-1");
            expect(pass.cross_check && pass.cross_check->outcome == cross_check_outcome::pass);
            const auto &fail = report_of(res, "hk-2");
            expect(fail.cross_check && fail.cross_check->outcome == cross_check_outcome::fail);
            expect(fail.reward && *fail.reward == 0.0);
            test_same(1, f.uptime.scores("hk-2").consecutive_down);
            const auto &silent = report_of(res, "hk-3");
            expect(silent.cross_check && silent.cross_check->outcome == cross_check_outcome::indeterminate);
            expect(!silent.reward);
            test_same(1, f.uptime.scores("hk-3").consecutive_down);
            test_same(1, client.calls("Benchmark"));
        };
        "malformed claims make no network calls"_test = [] {
            round_fixture f {};
            f.add_miners(3);
            const transport_mock client { [](const miner::miner_info &m, const transport::synapse &syn) {
                if (syn.name == "Discovery" && m.hotkey == "hk-2")
                    return transport_mock::ok(discovery_output(100, 50));
                if (syn.name == "Discovery" && m.hotkey == "hk-3")
                    return transport_mock::ok(discovery_output(990, 1000));
                return honest(m, syn);
            } };
            const auto res = f.run(client);
            const auto &inverted = report_of(res, "hk-2");
            expect(inverted.validation.type == verdict_type::invalid);
            expect(!inverted.reward);
            const auto &narrow = report_of(res, "hk-3");
            expect(narrow.cross_check && narrow.cross_check->outcome == cross_check_outcome::fail);
            expect(narrow.reward && *narrow.reward == 0.0);
            test_same(1, client.calls("Challenge"));
            test_same(f.cfg.network(miner::network_type::bitcoin).min_range_size, f.btc->sample_calls());
            test_same(1, f.uptime.scores("hk-2").consecutive_down);
        };
        "transport errors count as downtime"_test = [] {
            round_fixture f {};
            f.add_miners(2);
            const transport_mock client { [](const miner::miner_info &m, const transport::synapse &syn) {
                if (m.hotkey == "hk-2")
                    return transport_mock::failure(403);
                return honest(m, syn);
            } };
            const auto res = f.run(client);
            const auto &r = report_of(res, "hk-2");
            expect(r.validation.type == verdict_type::transport_error);
            expect(!r.reward);
            test_same(1, f.uptime.scores("hk-2").consecutive_down);
            expect(report_of(res, "hk-1").reward.has_value());
        };
        "too few miners to cluster"_test = [] {
            round_fixture f { json::object { { "benchmark_cluster_count", 5 } } };
            f.add_miners(2);
            const transport_mock client { honest };
            const auto res = f.run(client);
            test_same(2, res.reports.size());
            expect(res.rewards.empty());
            test_same(0, client.calls("Benchmark"));
            for (const auto &r: res.reports)
                expect(r.stage == miner_stage::benchmark);
        };
        "authoritative client failure voids the network"_test = [] {
            round_fixture f {};
            f.add_miners(3);
            f.btc->fail_challenge = true;
            const transport_mock client { honest };
            const auto res = f.run(client);
            expect(res.rewards.empty());
            test_same(0, client.calls("Challenge"));
            for (const auto &r: res.reports) {
                expect(!r.cross_check);
                expect(!r.uptime_up);
                test_same(0, f.uptime.scores(r.miner.hotkey).observations);
            }
        };
        "malformed node data voids the network"_test = [] {
            round_fixture f {};
            f.add_miners(3);
            f.btc->malformed_from = 600;
            const transport_mock client { [](const miner::miner_info &m, const transport::synapse &syn) {
                if (syn.name == "Discovery" && m.hotkey != "hk-3")
                    return transport_mock::ok(discovery_output(1, 500));
                if (syn.name == "Discovery")
                    return transport_mock::ok(discovery_output(801, 1000));
                return honest(m, syn);
            } };
            const auto res = f.run(client);
            expect(res.rewards.empty());
            test_same(3, res.reports.size());
            for (const auto &r: res.reports) {
                expect(!r.cross_check) << r.miner.hotkey;
                expect(!r.uptime_up) << r.miner.hotkey;
                expect(r.note.find("skipped") != std::string::npos) << r.note;
                test_same(0, f.uptime.scores(r.miner.hotkey).observations);
            }
            test_same(0, client.calls("Benchmark"));
        };
        "duplicate hotkeys"_test = [] {
            round_fixture f {};
            f.add_miners(3);
            auto dup = f.miners.front();
            dup.uid = 99;
            dup.ip = "10.0.0.99";
            f.miners.emplace_back(dup);
            const transport_mock client { honest };
            const auto res = f.run(client);
            test_same(3, res.reports.size());
            size_t hk1_reports = 0;
            for (const auto &r: res.reports) {
                if (r.miner.hotkey == "hk-1") {
                    ++hk1_reports;
                    test_same(1, r.miner.uid);
                }
            }
            test_same(1, hk1_reports);
            test_same(1, f.uptime.scores("hk-1").observations);
            test_same(3, client.calls("Discovery"));
            for (const auto &rw: res.rewards)
                expect(rw.uid != 99);
        };
        "unreachable node at sync"_test = [] {
            round_fixture f {};
            f.add_miners(2);
            f.btc->fail_height = true;
            const transport_mock client { honest };
            const auto res = f.run(client);
            expect(res.rewards.empty());
            test_same(0, client.calls("Challenge"));
            test_same(0, f.uptime.scores("hk-1").observations);
        };
        "shared address"_test = [] {
            round_fixture f {};
            f.add_miners(2, "10.0.0.100");
            f.add_miners(1);
            const transport_mock client { honest };
            const auto res = f.run(client);
            expect(report_of(res, "hk-1").validation.type == verdict_type::invalid);
            expect(report_of(res, "hk-2").validation.type == verdict_type::invalid);
            expect(!report_of(res, "hk-1").reward);
            expect(report_of(res, "hk-3").reward.has_value());
        };
        "sampling"_test = [] {
            round_fixture f { json::object { { "sample_size", 3 } } };
            f.add_miners(6);
            const transport_mock client { honest };
            const auto res = f.run(client, 9);
            test_same(3, res.reports.size());
            test_same(3, client.calls("Discovery"));
        };
        "replayable"_test = [] {
            const transport_mock client { honest };
            round_fixture f1 {};
            f1.add_miners(4);
            round_fixture f2 {};
            f2.add_miners(4);
            const auto r1 = f1.run(client, 77);
            const auto r2 = f2.run(client, 77);
            test_same(r1.rewards.size(), r2.rewards.size());
            for (size_t i = 0; i < r1.rewards.size(); ++i) {
                test_same(r1.rewards[i].uid, r2.rewards[i].uid);
                test_same(r1.rewards[i].score, r2.rewards[i].score);
            }
        };
        "grace period"_test = [] {
            round_fixture f { json::object { { "grace_period", true }, { "grace_threshold_score", 0.3 } } };
            f.add_miners(2);
            const transport_mock client { [](const miner::miner_info &m, const transport::synapse &syn) {
                if (syn.name == "Discovery" && m.hotkey == "hk-2")
                    return transport_mock::ok(discovery_output(1, 1000, protocol_version - 1));
                return honest(m, syn);
            } };
            const auto res = f.run(client);
            const auto &old = report_of(res, "hk-2");
            expect(old.reward.has_value());
            test_close(0.3, *old.reward);
        };
        "init"_test = [] {
            round_fixture f { json::object { { "enforce_upgrade", true }, { "required_version", protocol_version + 1 } } };
            const transport_mock client { honest };
            const round_driver driver { client, f.nodes, f.uptime, f.score, f.weights, f.cfg, f.sched };
            expect(throws<fatal_error>([&] { driver.init(); }));
            expect(nothrow([&] { driver.init(protocol_version + 1); }));
            f.nodes.clear();
            expect(throws<fatal_error>([&] { driver.init(protocol_version + 1); }));
        };
    };
};
