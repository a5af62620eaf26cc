/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <condition_variable>
#include <map>
#include <optional>
#include <queue>
#include <vector>
#include <gs/logger.hpp>
#include <gs/mutex.hpp>
#include <gs/scheduler.hpp>
#include <gs/timer.hpp>

namespace graph_sentinel {
    struct scheduler::impl {
        explicit impl(const size_t user_num_workers)
            : _num_workers { std::max(user_num_workers, size_t { 1 }) }
        {
            _workers.reserve(_num_workers);
            for (size_t i = 0; i < _num_workers; ++i)
                _workers.emplace_back([this] { _worker_loop(); });
        }

        ~impl()
        {
            {
                mutex::scoped_lock lk { _tasks_mutex };
                _destroy = true;
            }
            _tasks_cv.notify_all();
            for (auto &t: _workers)
                t.join();
        }

        size_t num_workers() const
        {
            return _num_workers;
        }

        void submit(const std::string &task_group, int64_t priority, const std::function<std::any ()> &action)
        {
            {
                mutex::scoped_lock lk { _tasks_mutex };
                _tasks.emplace(priority, task_group, action);
                ++_task_counts[task_group];
            }
            _tasks_cv.notify_one();
        }

        void on_result(const std::string &task_group, const std::function<void (std::any &&)> &observer, const bool replace_if_exists)
        {
            if (const auto [it, created] = _observers.try_emplace(task_group, observer); !created) {
                if (!replace_if_exists)
                    throw error("task group {} already has an observer", task_group);
                it->second = observer;
            }
        }

        bool process_ok(const bool report_status, const std::source_location &loc)
        {
            timer t { fmt::format("scheduler::process from {}:{}", loc.file_name(), loc.line()), logger::level::trace };
            bool ok = true;
            size_t num_results = 0;
            for (;;) {
                std::optional<scheduled_result> res {};
                {
                    mutex::unique_lock lk { _results_mutex };
                    _results_cv.wait_for(lk, default_wait_interval, [&] { return !_results.empty(); });
                    if (!_results.empty()) {
                        res.emplace(std::move(_results.front()));
                        _results.pop();
                    }
                }
                if (res) {
                    ++num_results;
                    if (!_handle_result(std::move(*res)))
                        ok = false;
                    continue;
                }
                if (_task_count() == 0)
                    break;
            }
            _observers.clear();
            if (report_status)
                logger::trace("scheduler processed {} results ok: {}", num_results, ok);
            return ok;
        }
    private:
        using task_queue = std::priority_queue<scheduled_task>;

        const size_t _num_workers;
        std::vector<std::thread> _workers {};
        alignas(mutex::padding) mutex::unique_lock::mutex_type _tasks_mutex {};
        std::condition_variable _tasks_cv {};
        task_queue _tasks {};
        std::map<std::string, size_t> _task_counts {};
        bool _destroy = false;
        alignas(mutex::padding) mutex::unique_lock::mutex_type _results_mutex {};
        std::condition_variable _results_cv {};
        std::queue<scheduled_result> _results {};
        // accessed only from the thread calling process
        std::map<std::string, std::function<void (std::any &&)>> _observers {};

        size_t _task_count()
        {
            mutex::scoped_lock lk { _tasks_mutex };
            size_t total = 0;
            for (const auto &[group, cnt]: _task_counts)
                total += cnt;
            return total;
        }

        void _worker_loop()
        {
            for (;;) {
                std::optional<scheduled_task> task {};
                {
                    mutex::unique_lock lk { _tasks_mutex };
                    _tasks_cv.wait(lk, [&] { return _destroy || !_tasks.empty(); });
                    if (_tasks.empty())
                        return;
                    task.emplace(_tasks.top());
                    _tasks.pop();
                }
                scheduled_result res { task->priority, task->task_group };
                const auto start = std::chrono::steady_clock::now();
                try {
                    res.result = task->task();
                } catch (const std::exception &ex) {
                    res.result = scheduled_task_error { fmt::format("task {} failed: {}", task->task_group, ex.what()), *task };
                }
                res.cpu_time = std::chrono::duration<double> { std::chrono::steady_clock::now() - start }.count();
                {
                    mutex::scoped_lock lk { _results_mutex };
                    _results.emplace(std::move(res));
                }
                _results_cv.notify_one();
            }
        }

        bool _handle_result(scheduled_result &&res)
        {
            {
                mutex::scoped_lock lk { _tasks_mutex };
                if (auto it = _task_counts.find(res.task_group); it != _task_counts.end()) {
                    if (--it->second == 0)
                        _task_counts.erase(it);
                }
            }
            const bool failed = res.result.type() == typeid(scheduled_task_error);
            if (failed)
                logger::error("{}", std::any_cast<const scheduled_task_error &>(res.result).what());
            if (const auto obs_it = _observers.find(res.task_group); obs_it != _observers.end())
                obs_it->second(std::move(res.result));
            return !failed;
        }
    };

    scheduler::scheduler(const size_t user_num_workers)
        : _impl { std::make_unique<impl>(user_num_workers) }
    {
    }

    scheduler::~scheduler() =default;

    size_t scheduler::num_workers() const
    {
        return _impl->num_workers();
    }

    void scheduler::submit(const std::string &task_group, const int64_t priority, const std::function<std::any ()> &action)
    {
        _impl->submit(task_group, priority, action);
    }

    void scheduler::submit_void(const std::string &task_group, const int64_t priority, const std::function<void ()> &action)
    {
        _impl->submit(task_group, priority, [action] {
            action();
            return std::any {};
        });
    }

    void scheduler::on_result(const std::string &task_group, const std::function<void (std::any &&)> &observer, const bool replace_if_exists)
    {
        _impl->on_result(task_group, observer, replace_if_exists);
    }

    bool scheduler::process_ok(const bool report_status, const std::source_location &loc)
    {
        return _impl->process_ok(report_status, loc);
    }

    void scheduler::process(const bool report_status, const std::source_location &loc)
    {
        if (!process_ok(report_status, loc))
            throw error("some scheduled tasks have failed, please check the logs");
    }
}
