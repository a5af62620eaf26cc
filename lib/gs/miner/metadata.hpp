/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_MINER_METADATA_HPP
#define GRAPH_SENTINEL_MINER_METADATA_HPP

#include <chrono>
#include <optional>
#include <string>
#include <gs/container.hpp>
#include <gs/json.hpp>
#include <gs/miner/types.hpp>

namespace graph_sentinel::miner {
    // The commitment a miner publishes: b:<block>,v:<version>,di:'<image>',n:<network>,mt:<model>,ri:'<run id>'
    struct miner_metadata {
        uint64_t block = 0;
        uint64_t version = 0;
        std::string docker_image {};
        int64_t network_id = 0;
        int64_t model_id = 0;
        std::string run_id {};

        static miner_metadata from_compact(std::string_view compact);
        std::string to_compact() const;

        bool operator==(const miner_metadata &o) const =default;
    };
    using metadata_map = map<std::string, miner_metadata>;

    // Failures worth retrying such as a dropped connection to the source
    struct metadata_transient_error: error {
        using error::error;
    };

    struct metadata_source {
        virtual ~metadata_source() =default;

        std::optional<std::string> commitment(const std::string &hotkey) const
        {
            return _commitment_impl(hotkey);
        }
    private:
        virtual std::optional<std::string> _commitment_impl(const std::string &hotkey) const =0;
    };

    // A JSON object mapping hotkeys to their compact commitment strings
    struct metadata_source_file: metadata_source {
        explicit metadata_source_file(const std::string &path);
    private:
        json::object _commitments;

        std::optional<std::string> _commitment_impl(const std::string &hotkey) const override;
    };

    struct fetch_options {
        size_t retries = 5;
        std::chrono::milliseconds backoff { 1000 };
        size_t workers = 3;
    };

    // A JSON array of objects with uid, hotkey, coldkey, ip and port
    extern vector<miner_info> load_miners(const std::string &path);
    extern metadata_map fetch_metadata(const metadata_source &src, const vector<miner_info> &miners, const fetch_options &opts={});

    // Coldkey when known, otherwise the published run id
    extern std::string owner_of(const miner_info &miner, const metadata_map &metadata);
    extern map<std::string, size_t> hotkeys_per_ip(const vector<miner_info> &miners);
    extern map<std::string, size_t> hotkeys_per_owner(const vector<miner_info> &miners, const metadata_map &metadata);
}

namespace fmt {
    template<>
    struct formatter<graph_sentinel::miner::miner_metadata>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_compact());
        }
    };
}

#endif // !GRAPH_SENTINEL_MINER_METADATA_HPP
