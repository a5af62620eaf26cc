/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_NODE_BITCOIN_HPP
#define GRAPH_SENTINEL_NODE_BITCOIN_HPP

#include <gs/node/rpc.hpp>

namespace graph_sentinel::node {
    // bitcoind JSON-RPC. Each sample asks for a transaction identified by its funds flow.
    struct bitcoin: base {
        explicit bitcoin(rpc_client_ptr rpc, uint64_t seed=std::random_device {}());
        explicit bitcoin(const std::string &rpc_url, uint64_t seed=std::random_device {}());
    private:
        rpc_client_ptr _rpc;

        miner::network_type _network_impl() const override;
        int64_t _current_block_height_impl() const override;
        challenge_sample _create_sample_impl(int64_t height) const override;
    };
}

#endif // !GRAPH_SENTINEL_NODE_BITCOIN_HPP
