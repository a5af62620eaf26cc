/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <gs/logger.hpp>
#include <gs/validator/response.hpp>

namespace graph_sentinel::validator {
    namespace {
        const json::value &require(const json::object &o, const std::string_view key)
        {
            const auto it = o.find(key);
            if (it == o.end() || it->value().is_null())
                throw error(fmt::format("discovery output misses {}", key));
            return it->value();
        }

        int64_t require_height(const json::object &o, const std::string_view key)
        {
            const auto &v = require(o, key);
            const auto h = json::as_integer(v);
            if (!h)
                throw error(fmt::format("discovery {} must be an integer but got {}", key, json::serialize(v)));
            if (*h <= 0)
                throw error(fmt::format("discovery {} must be positive but got {}", key, *h));
            return *h;
        }

        size_t count_of(const map<std::string, size_t> &counts, const std::string &key)
        {
            const auto it = counts.find(key);
            return it != counts.end() ? it->second : 0;
        }

        verdict make_invalid(const unsigned status, std::string reason)
        {
            return verdict { verdict_type::invalid, status, std::move(reason) };
        }
    }

    miner::miner_claim parse_discovery(const miner::miner_info &source, const json::value &output)
    {
        const auto *obj = output.if_object();
        if (!obj)
            throw error("discovery output must be an object");
        const auto &meta_v = require(*obj, "metadata");
        const auto *meta = meta_v.if_object();
        if (!meta)
            throw error("discovery metadata must be an object");
        const auto &net_v = require(*meta, "network");
        const auto &model_v = require(*meta, "model_type");
        if (!net_v.is_string() || !model_v.is_string())
            throw error("discovery network and model_type must be strings");
        miner::miner_claim claim {};
        claim.source = source;
        claim.network = miner::network_from_name(net_v.get_string());
        claim.model = miner::model_from_name(model_v.get_string());
        claim.start_height = require_height(*obj, "start_block_height");
        claim.end_height = require_height(*obj, "block_height");
        if (claim.start_height > claim.end_height)
            throw error(fmt::format("discovery range is inverted: [{}, {}]", claim.start_height, claim.end_height));
        if (const auto it = obj->find("version"); it != obj->end() && !it->value().is_null()) {
            const auto ver = json::as_integer(it->value());
            if (!ver || *ver < 0)
                throw error(fmt::format("discovery version must be a non-negative integer but got {}", json::serialize(it->value())));
            claim.version = static_cast<uint64_t>(*ver);
        }
        return claim;
    }

    verdict validate_response(const miner::miner_info &source, const transport::response &resp, const validation_context &ctx)
    {
        if (!resp.is_success()) {
            logger::debug("{}: skipping the response: {}", source, resp);
            return verdict { verdict_type::transport_error, resp.status_code, fmt::format("transport: {}", resp) };
        }
        if (!resp.output)
            return make_invalid(resp.status_code, "no output");
        miner::miner_claim claim {};
        try {
            claim = parse_discovery(source, *resp.output);
        } catch (const std::exception &ex) {
            logger::debug("{}: malformed discovery: {}", source, ex.what());
            return make_invalid(resp.status_code, fmt::format("malformed: {}", ex.what()));
        }
        if (std::find(ctx.networks.begin(), ctx.networks.end(), claim.network) == ctx.networks.end())
            return make_invalid(resp.status_code, fmt::format("network {} is not validated", claim.network));
        const auto meta_it = ctx.metadata.find(source.hotkey);
        if (meta_it == ctx.metadata.end())
            return make_invalid(resp.status_code, "no published metadata");
        if (const auto &meta = meta_it->second; meta.network_id != miner::network_id(claim.network) || meta.model_id != miner::model_id(claim.model)) {
            return make_invalid(resp.status_code, fmt::format("claims {}/{} but published network id {} model id {}",
                claim.network, claim.model, meta.network_id, meta.model_id));
        }
        if (const auto n = count_of(ctx.hotkeys_per_ip, source.ip); n > ctx.max_multiple_ips)
            return make_invalid(resp.status_code, fmt::format("{} hotkeys share ip {}", n, source.ip));
        const auto owner = miner::owner_of(source, ctx.metadata);
        if (const auto n = count_of(ctx.hotkeys_per_owner, owner); n > ctx.max_multiple_run_ids)
            return make_invalid(resp.status_code, fmt::format("{} hotkeys share owner {}", n, owner));
        return verdict { verdict_type::valid, resp.status_code, {}, std::move(claim) };
    }
}
