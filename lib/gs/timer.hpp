/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_TIMER_HPP
#define GRAPH_SENTINEL_TIMER_HPP

#include <chrono>
#include <string>
#include <gs/logger.hpp>

namespace graph_sentinel {
    struct timer {
        explicit timer(const std::string_view title, const logger::level lev=logger::level::debug)
            : _title { title }, _level { lev }
        {
        }

        ~timer()
        {
            if (!_stopped)
                stop();
        }

        timer(const timer &) =delete;
        timer &operator=(const timer &) =delete;

        double duration() const
        {
            const auto end = _stopped ? _end : std::chrono::steady_clock::now();
            return std::chrono::duration<double> { end - _start }.count();
        }

        double stop(const bool report=true)
        {
            if (!_stopped) {
                _end = std::chrono::steady_clock::now();
                _stopped = true;
                if (report)
                    logger::log(_level, "timer {} took {:0.3f} secs", _title, duration());
            }
            return duration();
        }
    private:
        std::string _title;
        logger::level _level;
        std::chrono::steady_clock::time_point _start { std::chrono::steady_clock::now() };
        std::chrono::steady_clock::time_point _end {};
        bool _stopped = false;
    };
}

#endif // !GRAPH_SENTINEL_TIMER_HPP
