/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <boost/url.hpp>
#include <gs/base64.hpp>
#include <gs/logger.hpp>
#include <gs/node/rpc.hpp>

namespace graph_sentinel::node {
    rpc_http_client::rpc_http_client(const std::string &url, const std::chrono::milliseconds timeout)
        : _url { url }, _timeout { timeout }
    {
        boost::url u { url };
        if (u.has_userinfo()) {
            const auto creds = fmt::format("{}:{}", std::string { u.user() }, std::string { u.password() });
            _headers.emplace_back("Authorization", fmt::format("Basic {}", base64::encode(creds)));
            u.remove_userinfo();
            _url = std::string { u.buffer() };
        }
    }

    json::value rpc_http_client::_call_impl(const std::string &method, const json::array &params) const
    {
        const json::object req {
            { "jsonrpc", "2.0" },
            { "id", _next_id.fetch_add(1, std::memory_order_relaxed) },
            { "method", method },
            { "params", params }
        };
        const auto res = http::post(_url, json::serialize(req), _timeout, _headers);
        if (res.error)
            throw node_error("rpc {} to {} failed: {}", method, _url, *res.error);
        json::value resp {};
        try {
            resp = json::parse(res.body);
        } catch (const std::exception &ex) {
            throw node_error("rpc {} returned HTTP {} with an unparsable body: {}", method, res.status, ex.what());
        }
        const auto *obj = resp.if_object();
        if (!obj)
            throw node_error("rpc {} returned a non-object response: {}", method, json::serialize(resp));
        if (const auto err_it = obj->find("error"); err_it != obj->end() && !err_it->value().is_null())
            throw node_error("rpc {} returned an error: {}", method, json::serialize(err_it->value()));
        if (!res)
            throw node_error("rpc {} returned HTTP {}", method, res.status);
        const auto res_it = obj->find("result");
        if (res_it == obj->end())
            throw node_error("rpc {} response has no result", method);
        logger::trace("rpc {} took {:0.3f} secs", method, res.duration);
        return res_it->value();
    }
}
