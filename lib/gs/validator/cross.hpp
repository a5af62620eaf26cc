/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_VALIDATOR_CROSS_HPP
#define GRAPH_SENTINEL_VALIDATOR_CROSS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <gs/node/base.hpp>
#include <gs/transport.hpp>

namespace graph_sentinel::validator {
    enum class cross_check_outcome: uint8_t {
        pass, fail, indeterminate
    };

    struct cross_check_result {
        cross_check_outcome outcome = cross_check_outcome::indeterminate;
        double elapsed = 0.0;
        std::string reason {};
    };

    struct cross_check_options {
        int64_t min_range_size = 20;
        int64_t lookahead_tolerance = 3;
        std::chrono::milliseconds timeout = std::chrono::seconds { 100 };
    };

    // Return the reason a claimed range cannot be checked, if any
    extern std::optional<std::string> check_shape(int64_t start, int64_t end, int64_t min_range_size);
    extern std::optional<std::string> check_range(int64_t start, int64_t end, int64_t tip, int64_t min_range_size, int64_t lookahead_tolerance);

    // Samples min_range_size distinct blocks of the claimed range, fewer when the range known to the node is narrower,
    // and passes only when the miner answers every one of them correctly.
    // Throws node::node_error when the authoritative client fails; the miner is never blamed for that.
    extern cross_check_result cross_validate(const transport::client &client, const miner::miner_info &target, const node::base &node,
        int64_t claimed_start, int64_t claimed_end, const cross_check_options &opts={});
}

namespace fmt {
    template<>
    struct formatter<graph_sentinel::validator::cross_check_outcome>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using graph_sentinel::validator::cross_check_outcome;
            switch (v) {
                case cross_check_outcome::pass: return fmt::format_to(ctx.out(), "pass");
                case cross_check_outcome::fail: return fmt::format_to(ctx.out(), "fail");
                case cross_check_outcome::indeterminate: return fmt::format_to(ctx.out(), "indeterminate");
                default: throw graph_sentinel::error(fmt::format("unsupported cross_check_outcome value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !GRAPH_SENTINEL_VALIDATOR_CROSS_HPP
