/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_FILE_HPP
#define GRAPH_SENTINEL_FILE_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <gs/container.hpp>

namespace graph_sentinel::file {
    extern std::string read(const std::string &path);
    // Writes through a temporary file so that readers never observe a partial state
    extern void write(const std::string &path, std::string_view data);

    using path_list = vector<std::filesystem::path>;
    extern path_list files_with_ext(const std::string_view &dir, const std::string_view &ext);

    struct tmp {
        explicit tmp(const std::string &name);
        ~tmp();

        const std::string &path() const
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !GRAPH_SENTINEL_FILE_HPP
