/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <gs/http/client.hpp>
#include <gs/logger.hpp>
#include <gs/transport/http.hpp>

namespace graph_sentinel::transport {
    http_client::http_client(const std::string &validator_hotkey)
        : _hotkey { validator_hotkey }
    {
    }

    response http_client::_query_impl(const miner::miner_info &target, const synapse &syn, const std::chrono::milliseconds timeout) const
    {
        response resp {};
        const auto url = fmt::format("http://{}:{}/{}", target.ip, target.port, syn.name);
        http::header_list headers {};
        if (!_hotkey.empty())
            headers.emplace_back("X-Validator-Hotkey", _hotkey);
        try {
            const auto res = http::post(url, json::serialize(syn.body), timeout, headers);
            resp.process_time = res.duration;
            if (res.error) {
                resp.is_timeout = res.timed_out;
                resp.is_failure = !res.timed_out;
                resp.status_code = res.timed_out ? 408 : 503;
                logger::debug("{} {}: {}", target, syn.name, *res.error);
                return resp;
            }
            resp.status_code = res.status;
            if (res.status == 403) {
                resp.is_blacklist = true;
                return resp;
            }
            if (res.status < 200 || res.status >= 300) {
                resp.is_failure = true;
                return resp;
            }
            auto body = json::parse(res.body);
            if (const auto *obj = body.if_object(); obj) {
                if (const auto it = obj->find("output"); it != obj->end() && !it->value().is_null())
                    resp.output.emplace(it->value());
            }
        } catch (const std::exception &ex) {
            logger::debug("{} {}: failed to process the response: {}", target, syn.name, ex.what());
            resp.is_failure = true;
            if (resp.status_code == 0)
                resp.status_code = 500;
        }
        return resp;
    }
}
