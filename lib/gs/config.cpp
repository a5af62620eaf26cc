/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <filesystem>
#include <gs/config.hpp>
#include <gs/logger.hpp>

namespace graph_sentinel {
    config_file::config_file(const std::string &path)
        : _path { path }
    {
        try {
            _parsed = json::load(path).as_object();
        } catch (const std::exception &ex) {
            throw config_error("failed to load configuration file {}: {}", path, ex.what());
        }
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw config_error("configuration file {} does not have the element {}!", _path, name);
        return it->value();
    }

    static std::optional<std::string> &_configs_default_path()
    {
        static std::optional<std::string> p {};
        return p;
    }

    void configs_dir::set_default_path(const std::optional<std::string> &p)
    {
        _configs_default_path() = p;
    }

    std::string configs_dir::default_path()
    {
        std::optional<std::string> path = _configs_default_path();
        if (const char *env_path = std::getenv("GS_ETC"); !path && env_path)
            path.emplace(env_path);
        if (!path)
            path.emplace("./etc");
        logger::debug("Configuration directory: {}", *path);
        return *path;
    }

    const configs &configs_dir::get()
    {
        static configs_dir cfg { default_path() };
        return cfg;
    }

    configs_dir::configs_dir(const std::string &dir)
    {
        if (!std::filesystem::is_directory(dir))
            throw config_error("configuration directory {} does not exist!", dir);
        for (const auto &path: file::files_with_ext(dir, ".json"))
            _configs.emplace(path.stem().string(), path.string());
    }

    const config &configs_dir::_at_impl(const std::string &name) const
    {
        const auto it = _configs.find(name);
        if (it == _configs.end())
            throw config_error("there is no config named {}!", name);
        return it->second;
    }
}
