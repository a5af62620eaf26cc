/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_VALIDATOR_RESPONSE_HPP
#define GRAPH_SENTINEL_VALIDATOR_RESPONSE_HPP

#include <optional>
#include <string>
#include <gs/miner/metadata.hpp>
#include <gs/transport.hpp>

namespace graph_sentinel::validator {
    enum class verdict_type: uint8_t {
        valid, invalid, transport_error
    };

    struct verdict {
        verdict_type type = verdict_type::invalid;
        unsigned status_code = 0;
        std::string reason {};
        std::optional<miner::miner_claim> claim {};

        bool valid() const
        {
            return type == verdict_type::valid;
        }
    };

    // The round's snapshot the response validator checks claims against
    struct validation_context {
        const miner::metadata_map &metadata;
        const map<std::string, size_t> &hotkeys_per_ip;
        const map<std::string, size_t> &hotkeys_per_owner;
        const vector<miner::network_type> &networks;
        size_t max_multiple_ips = 1;
        size_t max_multiple_run_ids = 1;
    };

    // Throws on a structurally invalid discovery output
    extern miner::miner_claim parse_discovery(const miner::miner_info &source, const json::value &output);
    extern verdict validate_response(const miner::miner_info &source, const transport::response &resp, const validation_context &ctx);
}

namespace fmt {
    template<>
    struct formatter<graph_sentinel::validator::verdict_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using graph_sentinel::validator::verdict_type;
            switch (v) {
                case verdict_type::valid: return fmt::format_to(ctx.out(), "valid");
                case verdict_type::invalid: return fmt::format_to(ctx.out(), "invalid");
                case verdict_type::transport_error: return fmt::format_to(ctx.out(), "transport_error");
                default: throw graph_sentinel::error(fmt::format("unsupported verdict_type value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !GRAPH_SENTINEL_VALIDATOR_RESPONSE_HPP
