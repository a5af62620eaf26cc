/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_SCHEDULER_HPP
#define GRAPH_SENTINEL_SCHEDULER_HPP

#include <algorithm>
#include <any>
#include <chrono>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <thread>
#include <gs/error.hpp>

namespace graph_sentinel {
    struct scheduled_task {
        int64_t priority;
        std::string task_group;
        std::function<std::any ()> task;

        scheduled_task(int64_t prio, const std::string &tg, const std::function<std::any ()> &t)
            : priority { prio }, task_group { tg }, task { t }
        {
        }

        bool operator<(const scheduled_task &t) const noexcept
        {
            return priority < t.priority;
        }
    };

    struct scheduled_task_error: error {
        scheduled_task_error(const std::string &msg, const scheduled_task &task)
            : error { msg }, _task { task }
        {
        }

        const scheduled_task &task() const
        {
            return _task;
        }
    private:
        scheduled_task _task;
    };

    struct scheduled_result {
        int64_t priority = 0;
        std::string task_group {};
        std::any result {};
        double cpu_time = 0.0;
    };

    // A fixed-size worker pool. Results are delivered to observers in the thread calling process().
    // Tasks with a higher priority are dispatched first.
    struct scheduler {
        static constexpr std::chrono::milliseconds default_wait_interval { 10 };

        static size_t default_worker_count()
        {
            return std::max(std::thread::hardware_concurrency(), 1U);
        }

        explicit scheduler(size_t user_num_workers=scheduler::default_worker_count());
        ~scheduler();
        size_t num_workers() const;
        void submit(const std::string &task_group, int64_t priority, const std::function<std::any ()> &action);
        void submit_void(const std::string &task_group, int64_t priority, const std::function<void ()> &action);
        void on_result(const std::string &task_group, const std::function<void (std::any &&)> &observer, bool replace_if_exists=false);
        bool process_ok(bool report_status=true, const std::source_location &loc=std::source_location::current());
        void process(bool report_status=true, const std::source_location &loc=std::source_location::current());
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}

#endif // !GRAPH_SENTINEL_SCHEDULER_HPP
