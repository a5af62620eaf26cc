/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <charconv>
#include <thread>
#include <gs/logger.hpp>
#include <gs/miner/metadata.hpp>
#include <gs/scheduler.hpp>

namespace graph_sentinel::miner {
    namespace {
        template<typename T>
        T parse_int(const std::string_view key, const std::string_view val)
        {
            T res {};
            const auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), res);
            if (ec != std::errc {} || ptr != val.data() + val.size())
                throw error(fmt::format("invalid integer value for metadata field {}: '{}'", key, val));
            return res;
        }

        std::string_view strip_quotes(std::string_view val)
        {
            while (!val.empty() && val.front() == '\'')
                val.remove_prefix(1);
            while (!val.empty() && val.back() == '\'')
                val.remove_suffix(1);
            return val;
        }
    }

    miner_metadata miner_metadata::from_compact(const std::string_view compact)
    {
        miner_metadata m {};
        uint8_t seen = 0;
        std::string_view rest = compact;
        while (!rest.empty()) {
            const auto comma_pos = rest.find(',');
            const auto item = rest.substr(0, comma_pos);
            rest = comma_pos == rest.npos ? std::string_view {} : rest.substr(comma_pos + 1);
            const auto colon_pos = item.find(':');
            if (colon_pos == item.npos)
                throw error(fmt::format("metadata item without a value: '{}'", item));
            const auto key = item.substr(0, colon_pos);
            const auto val = strip_quotes(item.substr(colon_pos + 1));
            if (key == "b") {
                m.block = parse_int<uint64_t>(key, val);
                seen |= 1U << 0;
            } else if (key == "v") {
                m.version = parse_int<uint64_t>(key, val);
                seen |= 1U << 1;
            } else if (key == "di") {
                m.docker_image = val;
                seen |= 1U << 2;
            } else if (key == "n") {
                m.network_id = parse_int<int64_t>(key, val);
                seen |= 1U << 3;
            } else if (key == "mt") {
                m.model_id = parse_int<int64_t>(key, val);
                seen |= 1U << 4;
            } else if (key == "ri") {
                m.run_id = val;
                seen |= 1U << 5;
            } else {
                logger::trace("ignoring unknown metadata field {}", key);
            }
        }
        if (seen != 0x3F)
            throw error(fmt::format("incomplete miner metadata: '{}'", compact));
        return m;
    }

    std::string miner_metadata::to_compact() const
    {
        return fmt::format("b:{},v:{},di:'{}',n:{},mt:{},ri:'{}'", block, version, docker_image, network_id, model_id, run_id);
    }

    metadata_source_file::metadata_source_file(const std::string &path)
        : _commitments { json::load(path).as_object() }
    {
    }

    std::optional<std::string> metadata_source_file::_commitment_impl(const std::string &hotkey) const
    {
        const auto it = _commitments.find(hotkey);
        if (it == _commitments.end() || it->value().is_null())
            return {};
        return std::string { it->value().as_string() };
    }

    vector<miner_info> load_miners(const std::string &path)
    {
        const auto j = json::load(path);
        vector<miner_info> res {};
        set<std::string> hotkeys {};
        for (const auto &item: j.as_array()) {
            const auto &o = item.as_object();
            const auto uid = json::as_integer(o.at("uid"));
            const auto port = json::as_integer(o.at("port"));
            if (!uid || *uid < 0)
                throw error(fmt::format("{}: invalid miner uid: {}", path, json::serialize(o.at("uid"))));
            if (!port || *port <= 0 || *port > 0xFFFF)
                throw error(fmt::format("{}: invalid port for miner {}: {}", path, *uid, json::serialize(o.at("port"))));
            miner_info m { static_cast<uint64_t>(*uid), std::string { o.at("hotkey").as_string() } };
            if (const auto *ck = o.if_contains("coldkey"); ck && !ck->is_null())
                m.coldkey = ck->as_string();
            m.ip = o.at("ip").as_string();
            m.port = static_cast<uint16_t>(*port);
            if (!hotkeys.emplace(m.hotkey).second)
                throw error(fmt::format("{}: duplicate hotkey {}", path, m.hotkey));
            res.emplace_back(std::move(m));
        }
        logger::info("loaded {} miners from {}", res.size(), path);
        return res;
    }

    metadata_map fetch_metadata(const metadata_source &src, const vector<miner_info> &miners, const fetch_options &opts)
    {
        static const std::string task_group { "fetch-metadata" };
        metadata_map res {};
        scheduler sched { opts.workers };
        sched.on_result(task_group, [&](auto &&r) {
            if (r.type() == typeid(scheduled_task_error))
                return;
            if (auto item = std::any_cast<std::optional<std::pair<std::string, miner_metadata>>>(std::move(r)); item)
                res.insert_or_assign(std::move(item->first), std::move(item->second));
        });
        for (const auto &m: miners) {
            sched.submit(task_group, 0, [&src, &opts, hotkey=m.hotkey]() -> std::any {
                std::optional<std::pair<std::string, miner_metadata>> item {};
                for (size_t attempt = 1; attempt <= opts.retries; ++attempt) {
                    try {
                        if (const auto compact = src.commitment(hotkey); compact)
                            item.emplace(hotkey, miner_metadata::from_compact(*compact));
                        else
                            logger::debug("no metadata published by {}", hotkey);
                        break;
                    } catch (const metadata_transient_error &ex) {
                        logger::debug("metadata for {} attempt {}/{} failed: {}", hotkey, attempt, opts.retries, ex.what());
                        if (attempt < opts.retries)
                            std::this_thread::sleep_for(opts.backoff);
                    } catch (const std::exception &ex) {
                        logger::warn("skipping metadata for {}: {}", hotkey, ex.what());
                        break;
                    }
                }
                return item;
            });
        }
        sched.process(false);
        logger::info("got miner metadata for {}/{} miners", res.size(), miners.size());
        return res;
    }

    std::string owner_of(const miner_info &miner, const metadata_map &metadata)
    {
        if (!miner.coldkey.empty())
            return miner.coldkey;
        if (const auto it = metadata.find(miner.hotkey); it != metadata.end() && !it->second.run_id.empty())
            return it->second.run_id;
        return miner.hotkey;
    }

    map<std::string, size_t> hotkeys_per_ip(const vector<miner_info> &miners)
    {
        map<std::string, set<std::string>> hotkeys {};
        for (const auto &m: miners)
            hotkeys[m.ip].emplace(m.hotkey);
        map<std::string, size_t> res {};
        for (const auto &[ip, keys]: hotkeys)
            res.emplace(ip, keys.size());
        return res;
    }

    map<std::string, size_t> hotkeys_per_owner(const vector<miner_info> &miners, const metadata_map &metadata)
    {
        map<std::string, set<std::string>> hotkeys {};
        for (const auto &m: miners)
            hotkeys[owner_of(m, metadata)].emplace(m.hotkey);
        map<std::string, size_t> res {};
        for (const auto &[owner, keys]: hotkeys)
            res.emplace(owner, keys.size());
        return res;
    }
}
