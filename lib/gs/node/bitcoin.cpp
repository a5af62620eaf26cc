/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cmath>
#include <gs/logger.hpp>
#include <gs/node/bitcoin.hpp>

namespace graph_sentinel::node {
    namespace {
        int64_t to_satoshis(const json::value &amount)
        {
            const auto btc = json::as_number(amount);
            if (!btc)
                throw node_error("invalid bitcoin amount: {}", json::serialize(amount));
            return std::llround(*btc * 100'000'000.0);
        }

        int64_t input_total(const json::object &tx)
        {
            int64_t total = 0;
            for (const auto &vin: tx.at("vin").as_array()) {
                const auto &in = vin.as_object();
                if (in.contains("coinbase"))
                    continue;
                const auto prevout_it = in.find("prevout");
                if (prevout_it == in.end())
                    throw node_error("getblock returned an input without prevout; verbosity 3 is required");
                total += to_satoshis(prevout_it->value().at("value"));
            }
            return total;
        }

        int64_t output_total(const json::object &tx)
        {
            int64_t total = 0;
            for (const auto &vout: tx.at("vout").as_array())
                total += to_satoshis(vout.at("value"));
            return total;
        }
    }

    bitcoin::bitcoin(rpc_client_ptr rpc, const uint64_t seed)
        : base { seed }, _rpc { std::move(rpc) }
    {
        if (!_rpc)
            throw error("bitcoin node requires an rpc client");
    }

    bitcoin::bitcoin(const std::string &rpc_url, const uint64_t seed)
        : bitcoin { std::make_unique<rpc_http_client>(rpc_url), seed }
    {
    }

    miner::network_type bitcoin::_network_impl() const
    {
        return miner::network_type::bitcoin;
    }

    int64_t bitcoin::_current_block_height_impl() const
    {
        const auto res = _rpc->call("getblockcount");
        const auto height = json::as_integer(res);
        if (!height)
            throw node_error("getblockcount returned a non-integer: {}", json::serialize(res));
        return *height;
    }

    challenge_sample bitcoin::_create_sample_impl(const int64_t height) const
    {
        const auto hash = _rpc->call("getblockhash", json::array { height });
        const auto block = _rpc->call("getblock", json::array { hash, 3 });
        const auto &txs = block.at("tx").as_array();
        if (txs.empty())
            throw node_error("block {} has no transactions", height);
        size_t tx_idx = 0;
        // the coinbase is first; pick a regular transaction whenever the block has one
        if (txs.size() > 1)
            tx_idx = static_cast<size_t>(_uniform(1, static_cast<int64_t>(txs.size()) - 1));
        const auto &tx = txs.at(tx_idx).as_object();
        const std::string txid { tx.at("txid").as_string() };
        challenge_sample s {};
        s.height = height;
        s.expected = txid;
        s.question = json::object {
            { "kind", "funds_flow" },
            { "block_height", height },
            { "in_total_amount", input_total(tx) },
            { "out_total_amount", output_total(tx) },
            { "tx_id_last_4_chars", txid.substr(txid.size() >= 4 ? txid.size() - 4 : 0) }
        };
        logger::trace("bitcoin sample at block {} for tx {}", height, txid);
        return s;
    }
}
