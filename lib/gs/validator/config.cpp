/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <gs/logger.hpp>
#include <gs/validator/config.hpp>

namespace graph_sentinel::validator {
    namespace {
        const json::value *find(const json::object &o, const std::string_view key)
        {
            const auto it = o.find(key);
            if (it == o.end() || it->value().is_null())
                return nullptr;
            return &it->value();
        }

        int64_t read_int(const json::object &o, const std::string_view key, const int64_t def)
        {
            const auto *v = find(o, key);
            if (!v)
                return def;
            const auto i = json::as_integer(*v);
            if (!i)
                throw config_error("validator config: {} must be an integer but got {}", key, json::serialize(*v));
            return *i;
        }

        size_t read_size(const json::object &o, const std::string_view key, const size_t def)
        {
            const auto i = read_int(o, key, static_cast<int64_t>(def));
            if (i < 0)
                throw config_error("validator config: {} must be non-negative but got {}", key, i);
            return static_cast<size_t>(i);
        }

        double read_double(const json::object &o, const std::string_view key, const double def)
        {
            const auto *v = find(o, key);
            if (!v)
                return def;
            const auto d = json::as_number(*v);
            if (!d)
                throw config_error("validator config: {} must be a number but got {}", key, json::serialize(*v));
            return *d;
        }

        bool read_bool(const json::object &o, const std::string_view key, const bool def)
        {
            const auto *v = find(o, key);
            if (!v)
                return def;
            if (!v->is_bool())
                throw config_error("validator config: {} must be a boolean but got {}", key, json::serialize(*v));
            return v->get_bool();
        }

        std::string read_string(const json::object &o, const std::string_view key, const std::string &def)
        {
            const auto *v = find(o, key);
            if (!v)
                return def;
            if (!v->is_string())
                throw config_error("validator config: {} must be a string but got {}", key, json::serialize(*v));
            return std::string { v->get_string() };
        }

        std::chrono::milliseconds read_secs(const json::object &o, const std::string_view key, const std::chrono::milliseconds def)
        {
            const auto secs = read_double(o, key, static_cast<double>(def.count()) / 1000.0);
            if (secs <= 0)
                throw config_error("validator config: {} must be positive but got {}", key, secs);
            return std::chrono::milliseconds { static_cast<int64_t>(secs * 1000.0) };
        }

        // A key that is either one value for all networks or an object keyed by network name
        const json::value *per_network(const json::object &o, const std::string_view key, const miner::network_type n)
        {
            const auto *v = find(o, key);
            if (!v || !v->is_object())
                return v;
            return find(v->get_object(), fmt::format("{}", n));
        }
    }

    std::string default_benchmark_query(const miner::network_type n)
    {
        switch (n) {
            case miner::network_type::bitcoin:
                return "MATCH (t:Transaction) WHERE t.block_height >= {start} AND t.block_height <= {end} - {diff} "
                    "RETURN SUM(t.out_total_amount) AS total";
            case miner::network_type::ethereum:
                return "MATCH (a:Address)-[s:SENT]->(b:Address) WHERE s.block_height >= {start} AND s.block_height <= {end} - {diff} "
                    "RETURN SUM(s.value) AS total";
            default:
                throw config_error("no default benchmark query for network {}", n);
        }
    }

    score_weights score_weights::from_json(const json::object &o)
    {
        score_weights w {};
        w.coverage = read_double(o, "coverage", w.coverage);
        w.recency = read_double(o, "recency", w.recency);
        w.timeliness = read_double(o, "timeliness", w.timeliness);
        w.distribution = read_double(o, "distribution", w.distribution);
        w.response_time_scale = read_double(o, "response_time_scale", w.response_time_scale);
        w.recency_scale = read_double(o, "recency_scale", w.recency_scale);
        w.recent_range = read_double(o, "recent_range", w.recent_range);
        w.uptime_floor = read_double(o, "uptime_floor", w.uptime_floor);
        w.validate();
        return w;
    }

    void score_weights::validate() const
    {
        for (const auto &[name, val]: { std::pair { "coverage", coverage }, std::pair { "recency", recency },
                std::pair { "timeliness", timeliness }, std::pair { "distribution", distribution } }) {
            if (!(val >= 0.0))
                throw config_error("score weight {} must be non-negative but got {}", name, val);
        }
        if (!(coverage + recency + timeliness + distribution > 0.0))
            throw config_error("at least one score weight must be positive");
        if (!(response_time_scale > 0.0) || !(recency_scale > 0.0) || !(recent_range >= 0.0))
            throw config_error("score scales must be positive");
        if (!(uptime_floor >= 0.0 && uptime_floor <= 1.0))
            throw config_error("uptime_floor must be within [0, 1] but got {}", uptime_floor);
    }

    validator_config validator_config::from_json(const json::object &o)
    {
        validator_config c {};
        if (const auto *nets = find(o, "networks"); nets) {
            if (!nets->is_array())
                throw config_error("validator config: networks must be an array");
            c.networks.clear();
            for (const auto &n: nets->get_array()) {
                if (!n.is_string())
                    throw config_error("validator config: network names must be strings");
                c.networks.emplace_back(miner::network_from_name(n.get_string()));
            }
        }
        for (const auto n: c.networks) {
            network_config nc {};
            if (const auto *url = per_network(o, "nodes", n); url) {
                if (!url->is_string())
                    throw config_error("validator config: node url for {} must be a string", n);
                nc.rpc_url = url->get_string();
            }
            if (const auto *mrs = per_network(o, "min_range_size", n); mrs) {
                const auto i = json::as_integer(*mrs);
                if (!i)
                    throw config_error("validator config: min_range_size for {} must be an integer", n);
                nc.min_range_size = *i;
            }
            if (const auto *q = per_network(o, "benchmark_query", n); q) {
                if (!q->is_string())
                    throw config_error("validator config: benchmark_query for {} must be a string", n);
                nc.benchmark_query = q->get_string();
            } else {
                nc.benchmark_query = default_benchmark_query(n);
            }
            c.network_configs.insert_or_assign(n, std::move(nc));
        }
        c.sample_size = read_size(o, "sample_size", c.sample_size);
        c.worker_count = read_size(o, "worker_count", c.worker_count);
        c.discovery_timeout = read_secs(o, "discovery_timeout", c.discovery_timeout);
        c.challenge_timeout = read_secs(o, "challenge_timeout", c.challenge_timeout);
        c.benchmark_timeout = read_secs(o, "benchmark_timeout", c.benchmark_timeout);
        c.max_multiple_ips = read_size(o, "max_multiple_ips", c.max_multiple_ips);
        c.max_multiple_run_ids = read_size(o, "max_multiple_run_ids", c.max_multiple_run_ids);
        c.benchmark_cluster_count = read_size(o, "benchmark_cluster_count", c.benchmark_cluster_count);
        c.benchmark_chunk_size = read_size(o, "benchmark_chunk_size", c.benchmark_chunk_size);
        c.benchmark_diff_min = read_int(o, "benchmark_diff_min", c.benchmark_diff_min);
        c.benchmark_diff_max = read_int(o, "benchmark_diff_max", c.benchmark_diff_max);
        c.lookahead_tolerance = read_int(o, "lookahead_tolerance", c.lookahead_tolerance);
        c.uptime_window = read_size(o, "uptime_window", c.uptime_window);
        c.uptime_db = read_string(o, "uptime_db", c.uptime_db);
        c.alpha = read_double(o, "alpha", c.alpha);
        c.grace_period = read_bool(o, "grace_period", c.grace_period);
        c.grace_threshold_score = read_double(o, "grace_threshold_score", c.grace_threshold_score);
        c.required_version = static_cast<uint64_t>(read_size(o, "required_version", c.required_version));
        c.enforce_upgrade = read_bool(o, "enforce_upgrade", c.enforce_upgrade);
        c.metadata_retries = read_size(o, "metadata_retries", c.metadata_retries);
        c.metadata_backoff = std::chrono::milliseconds { read_size(o, "metadata_backoff_ms", c.metadata_backoff.count()) };
        if (const auto *s = find(o, "score"); s) {
            if (!s->is_object())
                throw config_error("validator config: score must be an object");
            c.score = score_weights::from_json(s->get_object());
        }
        c.validate();
        return c;
    }

    const network_config &validator_config::network(const miner::network_type n) const
    {
        const auto it = network_configs.find(n);
        if (it == network_configs.end())
            throw config_error("network {} is not configured", n);
        return it->second;
    }

    void validator_config::validate() const
    {
        if (networks.empty())
            throw config_error("validator config: at least one network must be configured");
        if (sample_size == 0)
            throw config_error("validator config: sample_size must be positive");
        if (worker_count == 0)
            throw config_error("validator config: worker_count must be positive");
        if (benchmark_cluster_count == 0)
            throw config_error("validator config: benchmark_cluster_count must be positive");
        if (benchmark_chunk_size == 0)
            throw config_error("validator config: benchmark_chunk_size must be positive");
        if (benchmark_diff_min < 0 || benchmark_diff_min > benchmark_diff_max)
            throw config_error("validator config: invalid benchmark diff range [{}, {}]", benchmark_diff_min, benchmark_diff_max);
        if (lookahead_tolerance < 0)
            throw config_error("validator config: lookahead_tolerance must be non-negative");
        if (uptime_window == 0)
            throw config_error("validator config: uptime_window must be positive");
        if (!(alpha > 0.0 && alpha <= 1.0))
            throw config_error("validator config: alpha must be within (0, 1] but got {}", alpha);
        if (!(grace_threshold_score >= 0.0 && grace_threshold_score <= 1.0))
            throw config_error("validator config: grace_threshold_score must be within [0, 1] but got {}", grace_threshold_score);
        for (const auto n: networks) {
            if (network(n).benchmark_query.empty())
                throw config_error("validator config: benchmark_query for {} is empty", n);
        }
        score.validate();
        logger::trace("validator config for {} networks is valid", networks.size());
    }
}
