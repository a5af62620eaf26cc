/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <charconv>
#include <filesystem>
#include <gs/logger.hpp>
#include <gs/validator/weights.hpp>

namespace graph_sentinel::validator {
    ema_weights::ema_weights(const double alpha)
        : _alpha { alpha }
    {
        if (!(_alpha > 0.0 && _alpha <= 1.0))
            throw error(fmt::format("alpha must be within (0, 1] but got {}", _alpha));
    }

    double ema_weights::weight(const uint64_t uid) const
    {
        const auto it = _weights.find(uid);
        return it != _weights.end() ? it->second : 0.0;
    }

    void ema_weights::_update_impl(const reward_list &rewards)
    {
        for (const auto &r: rewards) {
            auto &w = _weights[r.uid];
            w = _alpha * r.score + (1.0 - _alpha) * w;
            logger::trace("uid {} reward {:0.4f} weight {:0.4f}", r.uid, r.score, w);
        }
    }

    json::object ema_weights::to_json() const
    {
        json::object res {};
        for (const auto &[uid, w]: _weights)
            res.emplace(std::to_string(uid), w);
        return res;
    }

    void ema_weights::load(const std::string &path)
    {
        if (!std::filesystem::exists(path)) {
            logger::info("no saved weights at {}; starting from zero", path);
            return;
        }
        const auto j = json::load(path);
        weight_map loaded {};
        for (const auto &[key, val]: j.as_object()) {
            uint64_t uid = 0;
            const auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), uid);
            if (ec != std::errc {} || ptr != key.data() + key.size())
                throw error(fmt::format("invalid uid in the weights file {}: '{}'", path, std::string_view { key }));
            const auto w = json::as_number(val);
            if (!w || *w < 0.0 || *w > 1.0)
                throw error(fmt::format("invalid weight for uid {} in {}: {}", uid, path, json::serialize(val)));
            loaded.emplace(uid, *w);
        }
        _weights = std::move(loaded);
        logger::info("loaded weights for {} uids from {}", _weights.size(), path);
    }

    void ema_weights::save(const std::string &path) const
    {
        json::save_pretty(path, to_json());
    }
}
