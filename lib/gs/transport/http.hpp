/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_TRANSPORT_HTTP_HPP
#define GRAPH_SENTINEL_TRANSPORT_HTTP_HPP

#include <gs/transport.hpp>

namespace graph_sentinel::transport {
    // Posts the synapse body as JSON to http://<ip>:<port>/<synapse name>
    struct http_client: client {
        explicit http_client(const std::string &validator_hotkey={});
    private:
        std::string _hotkey;

        response _query_impl(const miner::miner_info &target, const synapse &syn, std::chrono::milliseconds timeout) const override;
    };
}

#endif // !GRAPH_SENTINEL_TRANSPORT_HTTP_HPP
