/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <gs/logger.hpp>
#include <gs/validator/benchmark.hpp>

namespace graph_sentinel::validator {
    namespace {
        void replace_all(std::string &text, const std::string_view from, const std::string_view to)
        {
            for (size_t pos = text.find(from); pos != text.npos; pos = text.find(from, pos + to.size()))
                text.replace(pos, from.size(), to);
        }

        struct chunk_job {
            miner::network_type network;
            std::string query;
            vector<miner::miner_claim> members;
            vector<transport::response> responses {};
        };
    }

    std::string render_query(const std::string_view tmpl, const int64_t start, const int64_t end, const int64_t diff)
    {
        std::string query { tmpl };
        replace_all(query, "{start}", std::to_string(start));
        replace_all(query, "{end}", std::to_string(end));
        replace_all(query, "{diff}", std::to_string(diff));
        return query;
    }

    size_t majority_index(const vector<std::string> &values)
    {
        if (values.empty())
            throw error("majority vote requires at least one value");
        map<std::string_view, size_t> counts {};
        for (const auto &v: values)
            ++counts[v];
        size_t best = 0;
        size_t best_count = 0;
        for (size_t i = 0; i < values.size(); ++i) {
            if (const auto cnt = counts.at(values[i]); cnt > best_count) {
                best = i;
                best_count = cnt;
            }
        }
        return best;
    }

    benchmark_engine::benchmark_engine(const transport::client &client, scheduler &sched, const validator_config &cfg)
        : _client { client }, _sched { sched }, _cfg { cfg }
    {
    }

    benchmark_report benchmark_engine::run(const vector<miner::miner_claim> &claims, std::mt19937_64 &rnd) const
    {
        static const std::string task_group { "benchmark" };
        benchmark_report report {};
        flat_map<miner::network_type, vector<miner::miner_claim>> by_network {};
        for (const auto &c: claims)
            by_network[c.network].emplace_back(c);

        vector<chunk_job> jobs {};
        for (const auto &[network, net_claims]: by_network) {
            vector<cluster_group> groups {};
            try {
                groups = build_clusters(net_claims, _cfg.benchmark_cluster_count, _cfg.benchmark_chunk_size, rnd);
            } catch (const clustering_error &ex) {
                logger::warn("skipping the benchmark for {}: {}", network, ex.what());
                report.skipped_networks.emplace_back(network);
                continue;
            }
            const auto &tmpl = _cfg.network(network).benchmark_query;
            for (const auto &g: groups) {
                for (const auto &chunk: g.chunks) {
                    auto diff = std::uniform_int_distribution<int64_t> { _cfg.benchmark_diff_min, _cfg.benchmark_diff_max }(rnd);
                    diff = std::min(diff, g.common_end - g.common_start);
                    jobs.emplace_back(chunk_job { network, render_query(tmpl, g.common_start, g.common_end, diff), chunk });
                }
            }
        }

        for (auto &job: jobs)
            job.responses.resize(job.members.size());
        // descending priorities keep the members of a chunk together in the queue so that they are queried at about the same time
        for (size_t j = 0; j < jobs.size(); ++j) {
            auto &job = jobs[j];
            const auto syn = transport::benchmark(job.query);
            const auto priority = static_cast<int64_t>(jobs.size() - j);
            for (size_t i = 0; i < job.members.size(); ++i) {
                _sched.submit_void(task_group, priority, [this, &job, syn, i] {
                    job.responses[i] = _client.query(job.members[i].source, syn, _cfg.benchmark_timeout);
                });
            }
        }
        if (!_sched.process_ok(false))
            logger::warn("some benchmark queries have failed; their miners count as non-responders");

        for (const auto &job: jobs) {
            vector<std::string> values {};
            vector<std::optional<size_t>> value_idx(job.members.size());
            for (size_t i = 0; i < job.members.size(); ++i) {
                const auto &resp = job.responses[i];
                if (resp.is_success() && resp.output) {
                    value_idx[i] = values.size();
                    values.emplace_back(json::serialize(*resp.output));
                }
            }
            if (values.empty()) {
                logger::info("{}: no miner of a chunk of {} responded to the benchmark", job.network, job.members.size());
                for (const auto &m: job.members)
                    report.vacant.emplace_back(m.source);
                continue;
            }
            const auto &majority = values[majority_index(values)];
            size_t num_agree = 0;
            for (size_t i = 0; i < job.members.size(); ++i) {
                const auto &resp = job.responses[i];
                const bool agrees = value_idx[i] && values[*value_idx[i]] == majority;
                if (agrees)
                    ++num_agree;
                report.outcomes.emplace_back(benchmark_outcome { job.members[i].source, job.network, resp.process_time,
                    value_idx[i] ? resp.output : std::optional<json::value> {}, agrees });
            }
            logger::debug("{}: {} of {} miners agree on the benchmark result", job.network, num_agree, job.members.size());
        }
        return report;
    }
}
