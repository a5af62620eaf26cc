/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_NODE_RPC_MOCK_HPP
#define GRAPH_SENTINEL_NODE_RPC_MOCK_HPP

#include <functional>
#include <mutex>
#include <gs/node/rpc.hpp>

namespace graph_sentinel::node {
    // Serves canned JSON-RPC results; an unknown method fails like an unreachable node would
    struct rpc_mock: rpc_client {
        using handler = std::function<json::value (const json::array &)>;

        map<std::string, handler> handlers {};

        size_t calls(const std::string &method) const
        {
            std::scoped_lock lk { _calls_mutex };
            const auto it = _calls.find(method);
            return it != _calls.end() ? it->second : 0;
        }
    private:
        mutable std::mutex _calls_mutex {};
        mutable map<std::string, size_t> _calls {};

        json::value _call_impl(const std::string &method, const json::array &params) const override
        {
            {
                std::scoped_lock lk { _calls_mutex };
                ++_calls[method];
            }
            const auto it = handlers.find(method);
            if (it == handlers.end())
                throw node_error(fmt::format("rpc method {} is not available", method));
            return it->second(params);
        }
    };
}

#endif // !GRAPH_SENTINEL_NODE_RPC_MOCK_HPP
