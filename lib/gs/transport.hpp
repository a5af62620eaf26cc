/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_TRANSPORT_HPP
#define GRAPH_SENTINEL_TRANSPORT_HPP

#include <chrono>
#include <optional>
#include <string>
#include <gs/json.hpp>
#include <gs/miner/types.hpp>

namespace graph_sentinel::transport {
    // A named request understood by miners
    struct synapse {
        std::string name {};
        json::object body {};
    };

    inline synapse discovery()
    {
        return { "Discovery", {} };
    }

    // the body lists the heights to check and the question for each of them
    inline synapse challenge(const json::object &request)
    {
        return { "Challenge", request };
    }

    inline synapse benchmark(const std::string &query)
    {
        return { "Benchmark", json::object { { "query", query } } };
    }

    struct response {
        std::optional<json::value> output {};
        double process_time = 0.0;
        unsigned status_code = 0;
        bool is_timeout = false;
        bool is_blacklist = false;
        bool is_failure = false;

        bool is_success() const
        {
            return !is_timeout && !is_blacklist && !is_failure && status_code >= 200 && status_code < 300;
        }
    };

    // Delivery is never assumed: implementations must report problems via the response flags and not throw.
    struct client {
        virtual ~client() =default;

        response query(const miner::miner_info &target, const synapse &syn, const std::chrono::milliseconds timeout) const
        {
            return _query_impl(target, syn, timeout);
        }
    private:
        virtual response _query_impl(const miner::miner_info &target, const synapse &syn, std::chrono::milliseconds timeout) const =0;
    };
}

namespace fmt {
    template<>
    struct formatter<graph_sentinel::transport::response>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "status: {} timeout: {} blacklist: {} failure: {} time: {:0.3f} has output: {}",
                v.status_code, v.is_timeout, v.is_blacklist, v.is_failure, v.process_time, v.output.has_value());
        }
    };
}

#endif // !GRAPH_SENTINEL_TRANSPORT_HPP
