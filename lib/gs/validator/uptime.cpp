/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <filesystem>
#include <sqlite3.h>
#include <gs/logger.hpp>
#include <gs/validator/uptime.hpp>

namespace graph_sentinel::validator {
    uptime_record::uptime_record(const size_t window)
        : _window { window }
    {
        if (_window == 0)
            throw error("uptime window must be positive");
    }

    uptime_record uptime_record::from_history(const size_t window, const std::string_view history, const uint64_t consecutive_up,
        const uint64_t consecutive_down, const uint64_t observations)
    {
        uptime_record rec { window };
        const auto skip = history.size() > window ? history.size() - window : 0;
        for (const char c: history.substr(skip)) {
            switch (c) {
                case '1': rec._history.emplace_back(true); break;
                case '0': rec._history.emplace_back(false); break;
                default: throw error(fmt::format("invalid uptime history character: '{}'", c));
            }
        }
        rec._consecutive_up = consecutive_up;
        rec._consecutive_down = consecutive_down;
        rec._observations = std::max(observations, static_cast<uint64_t>(rec._history.size()));
        return rec;
    }

    void uptime_record::up()
    {
        _observe(true);
    }

    void uptime_record::down()
    {
        _observe(false);
    }

    uptime_scores uptime_record::scores() const
    {
        uptime_scores s { 0.0, _consecutive_up, _consecutive_down, _observations };
        if (!_history.empty())
            s.average = static_cast<double>(std::count(_history.begin(), _history.end(), true)) / static_cast<double>(_history.size());
        return s;
    }

    std::string uptime_record::history() const
    {
        std::string res {};
        res.reserve(_history.size());
        for (const bool is_up: _history)
            res.push_back(is_up ? '1' : '0');
        return res;
    }

    void uptime_record::_observe(const bool is_up)
    {
        _history.emplace_back(is_up);
        while (_history.size() > _window)
            _history.pop_front();
        ++_observations;
        if (is_up) {
            ++_consecutive_up;
            _consecutive_down = 0;
        } else {
            ++_consecutive_down;
            _consecutive_up = 0;
        }
    }

    uptime_store_memory::uptime_store_memory(const size_t window)
        : _window { window }
    {
        if (_window == 0)
            throw error("uptime window must be positive");
    }

    void uptime_store_memory::_update(const std::string &hotkey, const bool is_up)
    {
        auto &part = _parts[_partition(hotkey)];
        mutex::scoped_lock lk { part.records_mutex };
        auto [it, created] = part.records.try_emplace(hotkey, _window);
        if (is_up)
            it->second.up();
        else
            it->second.down();
    }

    void uptime_store_memory::_up_impl(const std::string &hotkey)
    {
        _update(hotkey, true);
    }

    void uptime_store_memory::_down_impl(const std::string &hotkey)
    {
        _update(hotkey, false);
    }

    uptime_scores uptime_store_memory::_scores_impl(const std::string &hotkey) const
    {
        auto &part = _parts[_partition(hotkey)];
        mutex::scoped_lock lk { part.records_mutex };
        const auto it = part.records.find(hotkey);
        if (it == part.records.end())
            return {};
        return it->second.scores();
    }

    struct uptime_store_sqlite::impl {
        impl(const std::string &db_path, const size_t window)
            : _path { db_path }, _window { window }
        {
            if (_window == 0)
                throw error("uptime window must be positive");
            if (_path != ":memory:") {
                if (const auto parent = std::filesystem::path { _path }.parent_path(); !parent.empty())
                    std::filesystem::create_directories(parent);
            }
            if (const auto rc = sqlite3_open_v2(_path.c_str(), &_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr); rc != SQLITE_OK) {
                const std::string msg { _db ? sqlite3_errmsg(_db) : sqlite3_errstr(rc) };
                sqlite3_close(_db);
                _db = nullptr;
                throw error(fmt::format("failed to open the uptime database {}: {}", _path, msg));
            }
            try {
                _check(sqlite3_busy_timeout(_db, 5000), "busy_timeout");
                _exec("CREATE TABLE IF NOT EXISTS uptime ("
                    "hotkey TEXT PRIMARY KEY NOT NULL, "
                    "consecutive_up INTEGER NOT NULL DEFAULT 0, "
                    "consecutive_down INTEGER NOT NULL DEFAULT 0, "
                    "observations INTEGER NOT NULL DEFAULT 0, "
                    "history TEXT NOT NULL DEFAULT '')");
            } catch (const std::exception &) {
                sqlite3_close(_db);
                throw;
            }
            logger::debug("opened the uptime database {} with a window of {}", _path, _window);
        }

        ~impl()
        {
            if (const auto rc = sqlite3_close(_db); rc != SQLITE_OK)
                logger::warn("failed to close the uptime database {}: {}", _path, sqlite3_errstr(rc));
        }

        void update(const std::string &hotkey, const bool is_up)
        {
            mutex::scoped_lock lk { _part_mutexes[_partition(hotkey)] };
            auto rec = _load(hotkey);
            if (is_up)
                rec.up();
            else
                rec.down();
            _save(hotkey, rec);
        }

        uptime_scores scores(const std::string &hotkey) const
        {
            mutex::scoped_lock lk { _part_mutexes[_partition(hotkey)] };
            return _load(hotkey).scores();
        }
    private:
        // owns a prepared statement
        struct statement {
            statement(sqlite3 *db, const char *sql)
            {
                if (sqlite3_prepare_v2(db, sql, -1, &_stmt, nullptr) != SQLITE_OK)
                    throw error(fmt::format("failed to prepare an uptime statement: {}", sqlite3_errmsg(db)));
            }

            ~statement()
            {
                sqlite3_finalize(_stmt);
            }

            statement(const statement &) =delete;
            statement &operator=(const statement &) =delete;

            sqlite3_stmt *get() const
            {
                return _stmt;
            }
        private:
            sqlite3_stmt *_stmt = nullptr;
        };

        const std::string _path;
        const size_t _window;
        sqlite3 *_db = nullptr;
        mutable std::array<std::mutex, num_partitions> _part_mutexes {};

        void _exec(const char *sql)
        {
            char *err_msg = nullptr;
            if (sqlite3_exec(_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
                const std::string msg { err_msg ? err_msg : "unknown error" };
                sqlite3_free(err_msg);
                throw error(fmt::format("uptime database {}: {}", _path, msg));
            }
        }

        void _check(const int rc, const std::string_view op) const
        {
            if (rc != SQLITE_OK)
                throw error(fmt::format("uptime database {}: {} failed: {}", _path, op, sqlite3_errmsg(_db)));
        }

        uptime_record _load(const std::string &hotkey) const
        {
            statement stmt { _db, "SELECT consecutive_up, consecutive_down, observations, history FROM uptime WHERE hotkey = ?" };
            _check(sqlite3_bind_text(stmt.get(), 1, hotkey.c_str(), -1, SQLITE_TRANSIENT), "bind");
            switch (const auto rc = sqlite3_step(stmt.get()); rc) {
                case SQLITE_ROW: {
                    const auto *hist = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 3));
                    return uptime_record::from_history(_window, hist ? std::string_view { hist } : std::string_view {},
                        static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0)),
                        static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1)),
                        static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 2)));
                }
                case SQLITE_DONE:
                    return uptime_record { _window };
                default:
                    throw error(fmt::format("uptime database {}: select failed: {}", _path, sqlite3_errmsg(_db)));
            }
        }

        void _save(const std::string &hotkey, const uptime_record &rec)
        {
            statement stmt { _db, "INSERT INTO uptime (hotkey, consecutive_up, consecutive_down, observations, history) VALUES (?, ?, ?, ?, ?) "
                "ON CONFLICT(hotkey) DO UPDATE SET consecutive_up = excluded.consecutive_up, consecutive_down = excluded.consecutive_down, "
                "observations = excluded.observations, history = excluded.history" };
            const auto s = rec.scores();
            const auto hist = rec.history();
            _check(sqlite3_bind_text(stmt.get(), 1, hotkey.c_str(), -1, SQLITE_TRANSIENT), "bind");
            _check(sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(s.consecutive_up)), "bind");
            _check(sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(s.consecutive_down)), "bind");
            _check(sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(s.observations)), "bind");
            _check(sqlite3_bind_text(stmt.get(), 5, hist.c_str(), -1, SQLITE_TRANSIENT), "bind");
            if (sqlite3_step(stmt.get()) != SQLITE_DONE)
                throw error(fmt::format("uptime database {}: upsert of {} failed: {}", _path, hotkey, sqlite3_errmsg(_db)));
        }
    };

    uptime_store_sqlite::uptime_store_sqlite(const std::string &db_path, const size_t window)
        : _impl { std::make_unique<impl>(db_path, window) }
    {
    }

    uptime_store_sqlite::~uptime_store_sqlite() =default;

    void uptime_store_sqlite::_up_impl(const std::string &hotkey)
    {
        _impl->update(hotkey, true);
    }

    void uptime_store_sqlite::_down_impl(const std::string &hotkey)
    {
        _impl->update(hotkey, false);
    }

    uptime_scores uptime_store_sqlite::_scores_impl(const std::string &hotkey) const
    {
        return _impl->scores(hotkey);
    }
}
