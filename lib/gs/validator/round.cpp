/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <iterator>
#include <gs/logger.hpp>
#include <gs/timer.hpp>
#include <gs/validator/round.hpp>

namespace graph_sentinel::validator {
    round_driver::round_driver(const transport::client &client, const node::node_set &nodes, uptime_store &uptime, const scorer &score,
            reward_sink &sink, const validator_config &cfg, scheduler &sched)
        : _client { client }, _nodes { nodes }, _uptime { uptime }, _scorer { score }, _sink { sink }, _cfg { cfg }, _sched { sched }
    {
    }

    void round_driver::init(const uint64_t own_version) const
    {
        if (_cfg.enforce_upgrade && own_version < _cfg.required_version)
            throw fatal_error(fmt::format("protocol version {} is below the required {}; upgrade before validating", own_version, _cfg.required_version));
        for (const auto n: _cfg.networks) {
            if (!_nodes.contains(n) || !_nodes.at(n))
                throw fatal_error(fmt::format("no authoritative client is configured for network {}", n));
        }
        logger::info("validator protocol version {} required {} networks {}", own_version, _cfg.required_version, _cfg.networks.size());
    }

    void round_driver::sync()
    {
        for (const auto n: _cfg.networks) {
            const auto it = _nodes.find(n);
            if (it == _nodes.end() || !it->second) {
                _heights.erase(n);
                continue;
            }
            try {
                const auto h = it->second->current_block_height();
                _heights[n] = h;
                logger::debug("{}: authoritative height {}", n, h);
            } catch (const std::exception &ex) {
                _heights.erase(n);
                logger::error("{}: failed to fetch the authoritative height, skipping the network until the next sync: {}", n, ex.what());
            }
        }
    }

    void round_driver::_discover(vector<miner_report> &reports, vector<double> &latencies, const validation_context &ctx)
    {
        vector<transport::response> responses(reports.size());
        for (size_t i = 0; i < reports.size(); ++i) {
            _sched.submit_void("discovery", 0, [this, &reports, &responses, i] {
                responses[i] = _client.query(reports[i].miner, transport::discovery(), _cfg.discovery_timeout);
            });
        }
        if (!_sched.process_ok(false))
            logger::warn("some discovery queries failed; their miners are treated as unreachable");
        for (size_t i = 0; i < reports.size(); ++i) {
            auto &rep = reports[i];
            rep.validation = validate_response(rep.miner, responses[i], ctx);
            latencies[i] = responses[i].process_time;
            if (!rep.validation.valid()) {
                rep.uptime_up = false;
                rep.note = rep.validation.reason;
                logger::debug("miner {} {}: {}", rep.miner.uid, rep.validation.type, rep.validation.reason);
            }
        }
    }

    void round_driver::_cross_validate(vector<miner_report> &reports)
    {
        struct task_result {
            std::optional<cross_check_result> result {};
            std::optional<std::string> node_failure {};
            std::optional<std::string> failure {};
        };
        vector<task_result> results(reports.size());
        for (size_t i = 0; i < reports.size(); ++i) {
            auto &rep = reports[i];
            if (!rep.validation.valid())
                continue;
            const auto network = rep.validation.claim->network;
            rep.stage = miner_stage::cross_validation;
            if (!_heights.contains(network)) {
                rep.note = fmt::format("the authoritative client for {} is unavailable this round", network);
                continue;
            }
            const auto *node = _nodes.at(network).get();
            const cross_check_options opts { _cfg.network(network).min_range_size, _cfg.lookahead_tolerance, _cfg.challenge_timeout };
            _sched.submit_void("cross-validation", 0, [this, &reports, &results, i, node, opts] {
                const auto &claim = *reports[i].validation.claim;
                try {
                    results[i].result = cross_validate(_client, reports[i].miner, *node, claim.start_height, claim.end_height, opts);
                } catch (const node::node_error &ex) {
                    results[i].node_failure = ex.what();
                } catch (const std::exception &ex) {
                    results[i].failure = ex.what();
                }
            });
        }
        _sched.process(false);

        // a node failure in any check of a network voids the whole network's results for the round
        flat_set<miner::network_type> failed_networks {};
        for (size_t i = 0; i < reports.size(); ++i) {
            if (results[i].node_failure) {
                const auto network = reports[i].validation.claim->network;
                if (failed_networks.emplace(network).second)
                    logger::error("{}: the authoritative client failed during cross-validation: {}", network, *results[i].node_failure);
            }
        }
        if (!failed_networks.empty())
            logger::warn("discarding the cross-validation results of networks {}", failed_networks);
        for (size_t i = 0; i < reports.size(); ++i) {
            auto &rep = reports[i];
            if (rep.stage != miner_stage::cross_validation || !rep.note.empty())
                continue;
            const auto &res = results[i];
            if (failed_networks.contains(rep.validation.claim->network)) {
                rep.note = "cross-validation skipped: the authoritative client failed";
                continue;
            }
            if (!res.result) {
                rep.note = fmt::format("cross-validation error: {}", res.failure.value_or("the task did not complete"));
                logger::warn("miner {} {}", rep.miner.uid, rep.note);
                continue;
            }
            rep.cross_check = res.result;
            switch (res.result->outcome) {
                case cross_check_outcome::pass:
                    break;
                case cross_check_outcome::fail:
                    rep.reward = 0.0;
                    rep.uptime_up = false;
                    rep.note = res.result->reason;
                    break;
                case cross_check_outcome::indeterminate:
                    rep.uptime_up = false;
                    rep.note = res.result->reason;
                    break;
                default:
                    throw error(fmt::format("unsupported cross_check_outcome value: {}", static_cast<int>(res.result->outcome)));
            }
            logger::debug("miner {} cross-validation {} in {:0.3f} sec", rep.miner.uid, res.result->outcome, res.result->elapsed);
        }
    }

    void round_driver::_benchmark(vector<miner_report> &reports, std::mt19937_64 &rnd)
    {
        vector<miner::miner_claim> claims {};
        map<std::string, size_t> index {};
        for (size_t i = 0; i < reports.size(); ++i) {
            auto &rep = reports[i];
            if (!rep.cross_check || rep.cross_check->outcome != cross_check_outcome::pass)
                continue;
            rep.stage = miner_stage::benchmark;
            claims.emplace_back(*rep.validation.claim);
            index.emplace(rep.miner.hotkey, i);
        }
        if (claims.empty())
            return;
        const benchmark_engine engine { _client, _sched, _cfg };
        const auto bench = engine.run(claims, rnd);
        for (const auto n: bench.skipped_networks) {
            for (const auto &[hotkey, i]: index) {
                auto &rep = reports[i];
                if (rep.validation.claim->network == n) {
                    rep.uptime_up = false;
                    rep.note = "benchmark skipped: too few miners to cluster the network";
                }
            }
        }
        for (const auto &m: bench.vacant) {
            auto &rep = reports[index.at(m.hotkey)];
            rep.uptime_up = false;
            rep.note = "benchmark without consensus: nobody in the chunk responded";
        }
        for (const auto &o: bench.outcomes) {
            auto &rep = reports[index.at(o.miner.hotkey)];
            rep.benchmark = o;
            if (!o.agrees_with_majority) {
                rep.reward = 0.0;
                rep.uptime_up = false;
                rep.note = o.output ? "benchmark result disagrees with the majority" : "no benchmark response";
                continue;
            }
            rep.stage = miner_stage::scored;
            rep.uptime_up = true;
        }
    }

    void round_driver::_record_uptime(const vector<miner_report> &reports)
    {
        size_t num_up = 0, num_down = 0;
        for (const auto &rep: reports) {
            if (!rep.uptime_up)
                continue;
            const auto ex = logger::run_log_errors([&] {
                if (*rep.uptime_up)
                    _uptime.up(rep.miner.hotkey);
                else
                    _uptime.down(rep.miner.hotkey);
            });
            if (!ex)
                ++(*rep.uptime_up ? num_up : num_down);
        }
        logger::info("uptime observations: {} up {} down", num_up, num_down);
    }

    void round_driver::_score(vector<miner_report> &reports, const vector<double> &latencies, const validation_context &ctx) const
    {
        vector<miner::miner_claim> valid_claims {};
        for (const auto &rep: reports) {
            if (rep.validation.valid())
                valid_claims.emplace_back(*rep.validation.claim);
        }
        for (size_t i = 0; i < reports.size(); ++i) {
            auto &rep = reports[i];
            if (rep.stage != miner_stage::scored)
                continue;
            const auto &claim = *rep.validation.claim;
            if (_cfg.grace_period && claim.version != _cfg.required_version) {
                rep.reward = _cfg.grace_threshold_score;
                rep.note = fmt::format("grace period for version {}", claim.version);
                continue;
            }
            logger::run_log_errors([&] {
                const auto tip = _heights.at(claim.network);
                auto dist = make_distribution(claim.network, valid_claims, _cfg.networks.size(), tip, _cfg.score.recent_range);
                const auto ip_it = ctx.hotkeys_per_ip.find(rep.miner.ip);
                const auto owner_it = ctx.hotkeys_per_owner.find(miner::owner_of(rep.miner, ctx.metadata));
                dist.same_source_miners = std::max(ip_it != ctx.hotkeys_per_ip.end() ? ip_it->second : size_t { 1 },
                    owner_it != ctx.hotkeys_per_owner.end() ? owner_it->second : size_t { 1 });
                const auto adjusted_time = std::max(0.0, rep.benchmark->response_time - latencies[i]);
                const auto uptime = _uptime.scores(rep.miner.hotkey);
                rep.reward = _scorer.calculate_score(claim.network, adjusted_time, claim.start_height, claim.end_height, tip, dist, uptime.average);
                logger::debug("miner {} score {:0.4f} time {:0.3f} uptime {:0.3f}", rep.miner.uid, *rep.reward, adjusted_time, uptime.average);
            });
        }
    }

    round_result round_driver::run_round(const round_input &input)
    {
        timer t { fmt::format("validation round with seed {}", input.seed), logger::level::info };
        std::mt19937_64 rnd { input.seed };
        // every report and uptime record is keyed by hotkey, so only the first miner with a given hotkey takes part
        vector<miner::miner_info> miners {};
        miners.reserve(input.miners.size());
        set<std::string> hotkeys {};
        for (const auto &m: input.miners) {
            if (hotkeys.emplace(m.hotkey).second)
                miners.emplace_back(m);
            else
                logger::warn("miner {} repeats hotkey {}, ignoring it this round", m.uid, m.hotkey);
        }
        vector<miner::miner_info> sampled {};
        std::sample(miners.begin(), miners.end(), std::back_inserter(sampled), _cfg.sample_size, rnd);
        logger::info("sampled {} of {} miners", sampled.size(), miners.size());

        const auto per_ip = miner::hotkeys_per_ip(miners);
        const auto per_owner = miner::hotkeys_per_owner(miners, input.metadata);
        const validation_context ctx { input.metadata, per_ip, per_owner, _cfg.networks, _cfg.max_multiple_ips, _cfg.max_multiple_run_ids };

        round_result res {};
        res.reports.reserve(sampled.size());
        for (auto &m: sampled)
            res.reports.emplace_back(miner_report { std::move(m) });
        vector<double> latencies(res.reports.size(), 0.0);

        _discover(res.reports, latencies, ctx);
        _cross_validate(res.reports);
        _benchmark(res.reports, rnd);
        _record_uptime(res.reports);
        _score(res.reports, latencies, ctx);

        for (const auto &rep: res.reports) {
            if (rep.reward)
                res.rewards.emplace_back(reward { rep.miner.uid, rep.miner.hotkey, *rep.reward });
            logger::info("miner {} stage {} reward {} note: {}", rep.miner.uid, rep.stage,
                rep.reward ? fmt::format("{:0.4f}", *rep.reward) : std::string { "none" }, rep.note);
        }
        if (!res.rewards.empty())
            _sink.update(res.rewards);
        return res;
    }
}
