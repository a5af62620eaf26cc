/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <gs/test.hpp>
#include <gs/validator/mocks.hpp>
#include <gs/validator/response.hpp>

using namespace graph_sentinel;
using namespace graph_sentinel::validator;

namespace {
    json::value discovery_output(const std::string &network, const int64_t start, const int64_t end)
    {
        return json::object {
            { "metadata", json::object { { "network", network }, { "model_type", "funds_flow" } } },
            { "start_block_height", start },
            { "block_height", end },
            { "version", 5 }
        };
    }
}

suite validator_response_suite = [] {
    "validator::response"_test = [] {
        const miner::miner_info m1 { 1, "hk-1", "", "10.0.0.1", 8091 };
        const miner::miner_info m2 { 2, "hk-2", "", "10.0.0.1", 8092 };
        miner::metadata_map meta {};
        meta.emplace("hk-1", miner::miner_metadata { 10, 5, "img", 1, 1, "run-1" });
        const vector<miner::network_type> networks { miner::network_type::bitcoin };
        const map<std::string, size_t> per_ip_ok { { "10.0.0.1", 1 } };
        const map<std::string, size_t> per_owner_ok { { "run-1", 1 } };

        "parse_discovery"_test = [&] {
            const auto c = parse_discovery(m1, discovery_output("bitcoin", 1, 1000));
            expect(c.source == m1);
            expect(c.network == miner::network_type::bitcoin);
            expect(c.model == miner::model_type::funds_flow);
            test_same(1, c.start_height);
            test_same(1000, c.end_height);
            test_same(5, c.version);
            json::value no_version = discovery_output("ethereum", 5, 5);
            no_version.as_object().erase("version");
            test_same(0, parse_discovery(m1, no_version).version);
        };
        "parse_discovery rejects"_test = [&] {
            expect(throws([&] { parse_discovery(m1, json::value("text")); }));
            expect(throws([&] { parse_discovery(m1, discovery_output("dogecoin", 1, 10)); }));
            expect(throws([&] { parse_discovery(m1, discovery_output("bitcoin", 0, 10)); }));
            expect(throws([&] { parse_discovery(m1, discovery_output("bitcoin", 11, 10)); }));
            json::value no_meta = discovery_output("bitcoin", 1, 10);
            no_meta.as_object().erase("metadata");
            expect(throws([&] { parse_discovery(m1, no_meta); }));
            json::value str_height = discovery_output("bitcoin", 1, 10);
            str_height.as_object()["block_height"] = "10";
            expect(throws([&] { parse_discovery(m1, str_height); }));
        };
        "valid"_test = [&] {
            const validation_context ctx { meta, per_ip_ok, per_owner_ok, networks, 1, 1 };
            const auto v = validate_response(m1, transport_mock::ok(discovery_output("bitcoin", 1, 1000)), ctx);
            expect(v.valid()) << v.reason;
            test_same(200, v.status_code);
            expect(v.claim.has_value());
        };
        "transport error"_test = [&] {
            const validation_context ctx { meta, per_ip_ok, per_owner_ok, networks, 1, 1 };
            const auto v = validate_response(m1, transport_mock::timeout(), ctx);
            expect(v.type == verdict_type::transport_error);
            test_same(408, v.status_code);
            expect(!v.claim);
            expect(validate_response(m1, transport_mock::failure(403), ctx).type == verdict_type::transport_error);
        };
        "invalid"_test = [&] {
            const validation_context ctx { meta, per_ip_ok, per_owner_ok, networks, 1, 1 };
            transport::response empty = transport_mock::ok(json::value {});
            empty.output.reset();
            expect(validate_response(m1, empty, ctx).type == verdict_type::invalid);
            expect(validate_response(m1, transport_mock::ok(json::value(42)), ctx).type == verdict_type::invalid);
            // a network that is known but not validated
            expect(validate_response(m1, transport_mock::ok(discovery_output("ethereum", 1, 1000)), ctx).type == verdict_type::invalid);
            // no metadata published
            expect(validate_response(m2, transport_mock::ok(discovery_output("bitcoin", 1, 1000)), ctx).type == verdict_type::invalid);
        };
        "claim contradicts published metadata"_test = [&] {
            const vector<miner::network_type> both { miner::network_type::bitcoin, miner::network_type::ethereum };
            const validation_context ctx { meta, per_ip_ok, per_owner_ok, both, 1, 1 };
            // hk-1 published n:1 (bitcoin)
            const auto v = validate_response(m1, transport_mock::ok(discovery_output("ethereum", 1, 1000)), ctx);
            expect(v.type == verdict_type::invalid);
            expect(v.reason.find("network id 1") != v.reason.npos) << v.reason;
            miner::metadata_map eth_meta {};
            eth_meta.emplace("hk-1", miner::miner_metadata { 10, 5, "img", 2, 1, "run-1" });
            const validation_context eth_ctx { eth_meta, per_ip_ok, per_owner_ok, both, 1, 1 };
            expect(validate_response(m1, transport_mock::ok(discovery_output("bitcoin", 1, 1000)), eth_ctx).type == verdict_type::invalid);
            expect(validate_response(m1, transport_mock::ok(discovery_output("ethereum", 1, 1000)), eth_ctx).valid());
            miner::metadata_map bad_model {};
            bad_model.emplace("hk-1", miner::miner_metadata { 10, 5, "img", 1, 7, "run-1" });
            const validation_context model_ctx { bad_model, per_ip_ok, per_owner_ok, both, 1, 1 };
            expect(validate_response(m1, transport_mock::ok(discovery_output("bitcoin", 1, 1000)), model_ctx).type == verdict_type::invalid);
        };
        "sybil caps"_test = [&] {
            const map<std::string, size_t> per_ip_crowded { { "10.0.0.1", 2 } };
            const validation_context ip_ctx { meta, per_ip_crowded, per_owner_ok, networks, 1, 1 };
            const auto v_ip = validate_response(m1, transport_mock::ok(discovery_output("bitcoin", 1, 1000)), ip_ctx);
            expect(v_ip.type == verdict_type::invalid);
            const validation_context ip_ctx_2 { meta, per_ip_crowded, per_owner_ok, networks, 2, 1 };
            expect(validate_response(m1, transport_mock::ok(discovery_output("bitcoin", 1, 1000)), ip_ctx_2).valid());
            const map<std::string, size_t> per_owner_crowded { { "run-1", 3 } };
            const validation_context owner_ctx { meta, per_ip_ok, per_owner_crowded, networks, 1, 2 };
            expect(validate_response(m1, transport_mock::ok(discovery_output("bitcoin", 1, 1000)), owner_ctx).type == verdict_type::invalid);
        };
    };
};
