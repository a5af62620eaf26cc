/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <fstream>
#include <sstream>
#include <gs/file.hpp>
#include <gs/logger.hpp>

namespace graph_sentinel::file {
    std::string read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        std::ostringstream ss {};
        ss << is.rdbuf();
        if (is.bad())
            throw error_sys(fmt::format("failed to read {}", path));
        return ss.str();
    }

    void write(const std::string &path, const std::string_view data)
    {
        const std::filesystem::path fs_path { path };
        if (fs_path.has_parent_path())
            std::filesystem::create_directories(fs_path.parent_path());
        const auto tmp_path = fmt::format("{}.tmp", path);
        {
            std::ofstream os { tmp_path, std::ios::binary | std::ios::trunc };
            if (!os)
                throw error_sys(fmt::format("failed to open {} for writing", tmp_path));
            os.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!os)
                throw error_sys(fmt::format("failed to write {}", tmp_path));
        }
        std::filesystem::rename(tmp_path, fs_path);
    }

    path_list files_with_ext(const std::string_view &dir, const std::string_view &ext)
    {
        path_list res {};
        for (const auto &entry: std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension().string() == ext)
                res.emplace_back(entry.path());
        }
        std::sort(res.begin(), res.end());
        return res;
    }

    tmp::tmp(const std::string &name)
        : _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
        if (ec)
            logger::warn("failed to remove a temporary file {}: {}", _path, ec.message());
    }
}
