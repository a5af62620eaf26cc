/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <charconv>
#include <gs/logger.hpp>
#include <gs/node/ethereum.hpp>

namespace graph_sentinel::node {
    int64_t parse_hex_quantity(std::string_view hex)
    {
        if (hex.starts_with("0x") || hex.starts_with("0X"))
            hex.remove_prefix(2);
        int64_t res = 0;
        const auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), res, 16);
        if (hex.empty() || ec != std::errc {} || ptr != hex.data() + hex.size())
            throw node_error(fmt::format("invalid hex quantity: '{}'", hex));
        return res;
    }

    ethereum::ethereum(rpc_client_ptr rpc, const uint64_t seed)
        : base { seed }, _rpc { std::move(rpc) }
    {
        if (!_rpc)
            throw error("ethereum node requires an rpc client");
    }

    ethereum::ethereum(const std::string &rpc_url, const uint64_t seed)
        : ethereum { std::make_unique<rpc_http_client>(rpc_url), seed }
    {
    }

    miner::network_type ethereum::_network_impl() const
    {
        return miner::network_type::ethereum;
    }

    int64_t ethereum::_current_block_height_impl() const
    {
        const auto res = _rpc->call("eth_blockNumber");
        if (!res.is_string())
            throw node_error("eth_blockNumber returned a non-string: {}", json::serialize(res));
        return parse_hex_quantity(res.get_string());
    }

    challenge_sample ethereum::_create_sample_impl(const int64_t height) const
    {
        const auto block = _rpc->call("eth_getBlockByNumber", json::array { fmt::format("0x{:x}", height), true });
        if (block.is_null())
            throw node_error("eth_getBlockByNumber returned no block for height {}", height);
        challenge_sample s {};
        s.height = height;
        const auto &txs = block.at("transactions").as_array();
        if (txs.empty()) {
            s.expected = std::string { block.at("hash").as_string() };
            s.question = json::object {
                { "kind", "block_hash" },
                { "block_height", height }
            };
            logger::trace("ethereum sample at empty block {}", height);
            return s;
        }
        const auto tx_idx = static_cast<size_t>(_uniform(0, static_cast<int64_t>(txs.size()) - 1));
        const auto &tx = txs.at(tx_idx).as_object();
        const auto &to = tx.at("to");
        s.expected = std::string { tx.at("hash").as_string() };
        s.question = json::object {
            { "kind", "funds_flow" },
            { "block_height", height },
            { "checksum", fmt::format("{}:{}:{}", std::string_view { tx.at("from").as_string() },
                to.is_null() ? std::string_view {} : std::string_view { to.as_string() },
                std::string_view { tx.at("value").as_string() }) }
        };
        logger::trace("ethereum sample at block {} for tx {}", height, s.expected);
        return s;
    }
}
