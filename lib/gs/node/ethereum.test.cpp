/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <gs/node/ethereum.hpp>
#include <gs/node/rpc-mock.hpp>
#include <gs/test.hpp>

using namespace graph_sentinel;
using namespace graph_sentinel::node;

namespace {
    json::object transfer(const json::value &to)
    {
        return json::object {
            { "hash", "0x5e1f" },
            { "from", "0xa11ce" },
            { "to", to },
            { "value", "0xde0b6b3a7640000" }
        };
    }

    struct ethereum_fixture {
        rpc_mock *rpc = nullptr;
        std::unique_ptr<ethereum> node {};

        explicit ethereum_fixture(const json::value &block)
        {
            auto r = std::make_unique<rpc_mock>();
            r->handlers.emplace("eth_blockNumber", [](const auto &) { return json::value("0x3e8"); });
            r->handlers.emplace("eth_getBlockByNumber", [block](const auto &) { return block; });
            rpc = r.get();
            node = std::make_unique<ethereum>(std::move(r), 7);
        }
    };
}

suite node_ethereum_suite = [] {
    "node::ethereum"_test = [] {
        "current block height"_test = [] {
            ethereum_fixture f { json::value(nullptr) };
            test_same(1000, f.node->current_block_height());
            expect(f.node->network() == miner::network_type::ethereum);
            f.rpc->handlers["eth_blockNumber"] = [](const auto &) { return json::value(1000); };
            expect(throws<node_error>([&] { f.node->current_block_height(); }));
        };
        "funds flow of a transfer"_test = [] {
            const json::value block = json::object { { "hash", "0xb10c" }, { "transactions", json::array { transfer(json::value("0xb0b")) } } };
            ethereum_fixture f { block };
            std::string requested {};
            bool full_txs = false;
            f.rpc->handlers["eth_getBlockByNumber"] = [&](const json::array &params) {
                requested = params.at(0).as_string();
                full_txs = params.at(1).as_bool();
                return block;
            };
            const auto ch = f.node->create_challenge(100, 100, 1);
            const auto &s = ch.samples.front();
            test_same(std::string { "0x64" }, requested);
            expect(full_txs);
            test_same(std::string { "funds_flow" }, std::string { s.question.at("kind").as_string() });
            test_same(std::string { "0xa11ce:0xb0b:0xde0b6b3a7640000" }, std::string { s.question.at("checksum").as_string() });
            test_same(std::string { "0x5e1f" }, s.expected);
            expect(f.node->validate_challenge_response_output(ch, json::array { "0x5E1F" }));
            expect(!f.node->validate_challenge_response_output(ch, json::array { "0xb10c" }));
        };
        "contract creation has no recipient"_test = [] {
            ethereum_fixture f { json::object { { "hash", "0xb10c" }, { "transactions", json::array { transfer(json::value(nullptr)) } } } };
            const auto ch = f.node->create_challenge(100, 100, 1);
            test_same(std::string { "0xa11ce::0xde0b6b3a7640000" }, std::string { ch.samples.front().question.at("checksum").as_string() });
        };
        "empty block asks for its hash"_test = [] {
            ethereum_fixture f { json::object { { "hash", "0xe3b0" }, { "transactions", json::array {} } } };
            const auto ch = f.node->create_challenge(100, 100, 1);
            const auto &s = ch.samples.front();
            test_same(std::string { "block_hash" }, std::string { s.question.at("kind").as_string() });
            test_same(100, s.question.at("block_height").to_number<int64_t>());
            test_same(std::string { "0xe3b0" }, s.expected);
            test_same(1, f.rpc->calls("eth_getBlockByNumber"));
        };
        "missing block"_test = [] {
            ethereum_fixture f { json::value(nullptr) };
            expect(throws<node_error>([&] { f.node->create_challenge(100, 100, 1); }));
        };
        "malformed transaction"_test = [] {
            ethereum_fixture f { json::object { { "hash", "0xb10c" }, { "transactions", json::array { json::object { { "hash", "0x1" } } } } } };
            expect(throws<node_error>([&] { f.node->create_challenge(100, 100, 1); }));
        };
        "distinct heights"_test = [] {
            ethereum_fixture f { json::object { { "hash", "0xe3b0" }, { "transactions", json::array {} } } };
            const auto ch = f.node->create_challenge(1, 1000, 20);
            test_same(20, ch.samples.size());
            test_same(20, f.rpc->calls("eth_getBlockByNumber"));
            for (size_t i = 1; i < ch.samples.size(); ++i)
                expect(ch.samples[i - 1].height < ch.samples[i].height);
        };
    };
};
