/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_NODE_RPC_HPP
#define GRAPH_SENTINEL_NODE_RPC_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <gs/http/client.hpp>
#include <gs/node/base.hpp>

namespace graph_sentinel::node {
    struct rpc_client {
        virtual ~rpc_client() =default;

        json::value call(const std::string &method, const json::array &params={}) const
        {
            return _call_impl(method, params);
        }
    private:
        virtual json::value _call_impl(const std::string &method, const json::array &params) const =0;
    };
    using rpc_client_ptr = std::unique_ptr<rpc_client>;

    // JSON-RPC over HTTP; credentials embedded in the URL are sent as basic auth
    struct rpc_http_client: rpc_client {
        explicit rpc_http_client(const std::string &url, std::chrono::milliseconds timeout=std::chrono::seconds { 30 });
    private:
        std::string _url;
        std::chrono::milliseconds _timeout;
        http::header_list _headers {};
        mutable std::atomic_uint64_t _next_id { 1 };

        json::value _call_impl(const std::string &method, const json::array &params) const override;
    };
}

#endif // !GRAPH_SENTINEL_NODE_RPC_HPP
