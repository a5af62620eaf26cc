/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_MINER_TYPES_HPP
#define GRAPH_SENTINEL_MINER_TYPES_HPP

#include <cstdint>
#include <string>
#include <gs/error.hpp>
#include <gs/format.hpp>

namespace graph_sentinel::miner {
    enum class network_type: uint8_t {
        bitcoin = 1,
        ethereum = 2
    };

    inline network_type network_from_name(const std::string_view name)
    {
        if (name == "bitcoin")
            return network_type::bitcoin;
        if (name == "ethereum")
            return network_type::ethereum;
        throw error(fmt::format("unsupported network: '{}'", name));
    }

    inline int64_t network_id(const network_type n)
    {
        return static_cast<int64_t>(n);
    }

    enum class model_type: uint8_t {
        funds_flow = 1
    };

    inline model_type model_from_name(const std::string_view name)
    {
        if (name == "funds_flow")
            return model_type::funds_flow;
        throw error(fmt::format("unsupported model type: '{}'", name));
    }

    inline int64_t model_id(const model_type m)
    {
        return static_cast<int64_t>(m);
    }

    // A miner as known from the network snapshot
    struct miner_info {
        uint64_t uid = 0;
        std::string hotkey {};
        std::string coldkey {};
        std::string ip {};
        uint16_t port = 0;

        bool operator==(const miner_info &o) const =default;
    };

    // Coverage a miner declares in its discovery response
    struct miner_claim {
        miner_info source {};
        network_type network = network_type::bitcoin;
        model_type model = model_type::funds_flow;
        int64_t start_height = 0;
        int64_t end_height = 0;
        uint64_t version = 0;
    };
}

namespace fmt {
    template<>
    struct formatter<graph_sentinel::miner::network_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using graph_sentinel::miner::network_type;
            switch (v) {
                case network_type::bitcoin: return fmt::format_to(ctx.out(), "bitcoin");
                case network_type::ethereum: return fmt::format_to(ctx.out(), "ethereum");
                default: throw graph_sentinel::error(fmt::format("unsupported network_type value: {}", static_cast<int>(v)));
            }
        }
    };

    template<>
    struct formatter<graph_sentinel::miner::model_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using graph_sentinel::miner::model_type;
            switch (v) {
                case model_type::funds_flow: return fmt::format_to(ctx.out(), "funds_flow");
                default: throw graph_sentinel::error(fmt::format("unsupported model_type value: {}", static_cast<int>(v)));
            }
        }
    };

    template<>
    struct formatter<graph_sentinel::miner::miner_info>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "uid {} {}@{}:{}", v.uid, v.hotkey, v.ip, v.port);
        }
    };

    template<>
    struct formatter<graph_sentinel::miner::miner_claim>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{} {} [{}, {}] v{}", v.source, v.network, v.start_height, v.end_height, v.version);
        }
    };
}

#endif // !GRAPH_SENTINEL_MINER_TYPES_HPP
