/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <gs/miner/metadata.hpp>
#include <gs/test.hpp>
#include <gs/validator/mocks.hpp>

using namespace graph_sentinel;
using namespace graph_sentinel::miner;

suite miner_metadata_suite = [] {
    "miner::metadata"_test = [] {
        "from_compact"_test = [] {
            const auto m = miner_metadata::from_compact("b:4321,v:5,di:'repo/miner:v5',n:1,mt:1,ri:'run-abc'");
            test_same(4321, m.block);
            test_same(5, m.version);
            test_same(std::string { "repo/miner:v5" }, m.docker_image);
            test_same(1, m.network_id);
            test_same(1, m.model_id);
            test_same(std::string { "run-abc" }, m.run_id);
            expect(m == miner_metadata::from_compact(m.to_compact()));
        };
        "unknown fields"_test = [] {
            const auto m = miner_metadata::from_compact("b:1,v:2,di:'img',n:2,mt:1,ri:'r',x:'extra'");
            test_same(2, m.network_id);
        };
        "incomplete or malformed"_test = [] {
            expect(throws([] { miner_metadata::from_compact("b:1,v:2,di:'img',n:1,mt:1"); }));
            expect(throws([] { miner_metadata::from_compact("b:one,v:2,di:'img',n:1,mt:1,ri:'r'"); }));
            expect(throws([] { miner_metadata::from_compact("b:1,v:2,di,n:1,mt:1,ri:'r'"); }));
            expect(throws([] { miner_metadata::from_compact(""); }));
        };
        "owner_of"_test = [] {
            metadata_map meta {};
            meta.emplace("hk-1", miner_metadata { 1, 5, "img", 1, 1, "run-1" });
            meta.emplace("hk-2", miner_metadata { 1, 5, "img", 1, 1, "" });
            test_same(std::string { "ck" }, owner_of(miner_info { 1, "hk-1", "ck" }, meta));
            test_same(std::string { "run-1" }, owner_of(miner_info { 1, "hk-1" }, meta));
            test_same(std::string { "hk-2" }, owner_of(miner_info { 2, "hk-2" }, meta));
            test_same(std::string { "hk-3" }, owner_of(miner_info { 3, "hk-3" }, meta));
        };
        "hotkey counters"_test = [] {
            const vector<miner_info> miners {
                { 1, "hk-1", "", "10.0.0.1", 8091 },
                { 2, "hk-2", "", "10.0.0.1", 8092 },
                { 3, "hk-3", "", "10.0.0.2", 8091 }
            };
            const auto per_ip = hotkeys_per_ip(miners);
            test_same(2, per_ip.at("10.0.0.1"));
            test_same(1, per_ip.at("10.0.0.2"));
            metadata_map meta {};
            meta.emplace("hk-1", miner_metadata { 1, 5, "img", 1, 1, "shared" });
            meta.emplace("hk-3", miner_metadata { 1, 5, "img", 1, 1, "shared" });
            const auto per_owner = hotkeys_per_owner(miners, meta);
            test_same(2, per_owner.at("shared"));
            test_same(1, per_owner.at("hk-2"));
        };
        "fetch_metadata"_test = [] {
            validator::metadata_source_mock src {};
            src.commitments.emplace("hk-1", miner_metadata { 100, 5, "img", 1, 1, "run-1" }.to_compact());
            src.commitments.emplace("hk-2", miner_metadata { 100, 4, "img", 1, 1, "run-2" }.to_compact());
            src.commitments.emplace("hk-3", "garbage");
            src.transient_failures.emplace("hk-2", 2);
            src.broken.emplace("hk-4");
            const vector<miner_info> miners {
                { 1, "hk-1" }, { 2, "hk-2" }, { 3, "hk-3" }, { 4, "hk-4" }, { 5, "hk-5" }
            };
            const auto meta = fetch_metadata(src, miners, fetch_options { 3, std::chrono::milliseconds { 1 }, 3 });
            test_same(2, meta.size());
            test_same(5, meta.at("hk-1").version);
            test_same(4, meta.at("hk-2").version);
            // two transient failures of hk-2 are retried, every other miner is asked once
            test_same(7, src.calls());
        };
        "fetch_metadata gives up"_test = [] {
            validator::metadata_source_mock src {};
            src.commitments.emplace("hk-1", miner_metadata { 100, 5, "img", 1, 1, "run-1" }.to_compact());
            src.transient_failures.emplace("hk-1", 10);
            const auto meta = fetch_metadata(src, { miner_info { 1, "hk-1" } }, fetch_options { 3, std::chrono::milliseconds { 1 }, 1 });
            expect(meta.empty());
            test_same(3, src.calls());
        };
        "load_miners"_test = [] {
            const file::tmp path { "gs-miners-test.json" };
            file::write(path.path(), R"([
                { "uid": 0, "hotkey": "hk-0", "coldkey": "ck-0", "ip": "10.0.0.1", "port": 8091 },
                { "uid": 7, "hotkey": "hk-7", "ip": "10.0.0.2", "port": 8092 }
            ])");
            const auto miners = load_miners(path.path());
            test_same(2, miners.size());
            expect(miners.at(0) == miner_info { 0, "hk-0", "ck-0", "10.0.0.1", 8091 });
            expect(miners.at(1) == miner_info { 7, "hk-7", "", "10.0.0.2", 8092 });
            file::write(path.path(), R"([ { "uid": 1, "hotkey": "hk", "ip": "10.0.0.1", "port": 70000 } ])");
            expect(throws([&] { load_miners(path.path()); }));
            file::write(path.path(), R"([ { "uid": 1, "hotkey": "hk", "ip": "a", "port": 1 }, { "uid": 2, "hotkey": "hk", "ip": "b", "port": 1 } ])");
            expect(throws([&] { load_miners(path.path()); }));
        };
    };
};
