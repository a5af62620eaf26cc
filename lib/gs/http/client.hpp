/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_HTTP_CLIENT_HPP
#define GRAPH_SENTINEL_HTTP_CLIENT_HPP

#include <chrono>
#include <optional>
#include <string>
#include <gs/container.hpp>

namespace graph_sentinel::http {
    struct post_result {
        std::string url {};
        unsigned status = 0;
        std::string body {};
        std::optional<std::string> error {};
        bool timed_out = false;
        double duration = 0.0;

        operator bool() const
        {
            return !static_cast<bool>(error) && status >= 200 && status < 300;
        }
    };

    using header_list = vector<std::pair<std::string, std::string>>;

    // Sends a POST request and blocks until a response arrives or the deadline passes.
    // Connection and protocol errors are reported through post_result::error.
    extern post_result post(const std::string &url, const std::string &body, std::chrono::milliseconds timeout,
        const header_list &headers={});
}

#endif // !GRAPH_SENTINEL_HTTP_CLIENT_HPP
