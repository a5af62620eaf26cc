/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_NODE_HPP
#define GRAPH_SENTINEL_NODE_HPP

#include <memory>
#include <gs/container.hpp>
#include <gs/node/base.hpp>

namespace graph_sentinel::node {
    using node_ptr = std::unique_ptr<base>;
    using node_set = map<miner::network_type, node_ptr>;

    extern node_ptr make_node(miner::network_type network, const std::string &rpc_url);
}

#endif // !GRAPH_SENTINEL_NODE_HPP
