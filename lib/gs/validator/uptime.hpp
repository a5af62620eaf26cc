/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_VALIDATOR_UPTIME_HPP
#define GRAPH_SENTINEL_VALIDATOR_UPTIME_HPP

#include <array>
#include <deque>
#include <memory>
#include <string>
#include <gs/container.hpp>
#include <gs/mutex.hpp>

namespace graph_sentinel::validator {
    struct uptime_scores {
        double average = 0.0;
        uint64_t consecutive_up = 0;
        uint64_t consecutive_down = 0;
        uint64_t observations = 0;
    };

    // Availability of one miner over a rolling window of its most recent rounds
    struct uptime_record {
        explicit uptime_record(size_t window=100);
        static uptime_record from_history(size_t window, const std::string_view history, uint64_t consecutive_up,
            uint64_t consecutive_down, uint64_t observations);

        void up();
        void down();
        uptime_scores scores() const;
        // the window as a string of '1' (up) and '0' (down), oldest first
        std::string history() const;
    private:
        size_t _window;
        std::deque<bool> _history {};
        uint64_t _consecutive_up = 0;
        uint64_t _consecutive_down = 0;
        uint64_t _observations = 0;

        void _observe(bool is_up);
    };

    struct uptime_store {
        static constexpr size_t num_partitions = 256;

        virtual ~uptime_store() =default;

        void up(const std::string &hotkey)
        {
            _up_impl(hotkey);
        }

        void down(const std::string &hotkey)
        {
            _down_impl(hotkey);
        }

        // An unknown miner has an average of zero
        uptime_scores scores(const std::string &hotkey) const
        {
            return _scores_impl(hotkey);
        }
    protected:
        static size_t _partition(const std::string &hotkey)
        {
            return std::hash<std::string> {}(hotkey) % num_partitions;
        }
    private:
        virtual void _up_impl(const std::string &hotkey) =0;
        virtual void _down_impl(const std::string &hotkey) =0;
        virtual uptime_scores _scores_impl(const std::string &hotkey) const =0;
    };

    struct uptime_store_memory: uptime_store {
        explicit uptime_store_memory(size_t window=100);
    private:
        struct partition {
            alignas(mutex::padding) std::mutex records_mutex {};
            map<std::string, uptime_record> records {};
        };

        const size_t _window;
        mutable std::array<partition, num_partitions> _parts {};

        void _update(const std::string &hotkey, bool is_up);
        void _up_impl(const std::string &hotkey) override;
        void _down_impl(const std::string &hotkey) override;
        uptime_scores _scores_impl(const std::string &hotkey) const override;
    };

    // Durable store in a SQLite database; one row per miner
    struct uptime_store_sqlite: uptime_store {
        explicit uptime_store_sqlite(const std::string &db_path, size_t window=100);
        ~uptime_store_sqlite() override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;

        void _up_impl(const std::string &hotkey) override;
        void _down_impl(const std::string &hotkey) override;
        uptime_scores _scores_impl(const std::string &hotkey) const override;
    };
}

#endif // !GRAPH_SENTINEL_VALIDATOR_UPTIME_HPP
