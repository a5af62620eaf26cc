/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_ERROR_HPP
#define GRAPH_SENTINEL_ERROR_HPP

#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <gs/format.hpp>

namespace graph_sentinel {
    struct error: std::runtime_error {
        explicit error(const std::string &msg, const std::source_location &loc=std::source_location::current());
        explicit error(const std::string &msg, const std::exception &cause, const std::source_location &loc=std::source_location::current());

        template<typename A0, typename ...Args>
            requires (!std::is_base_of_v<std::exception, std::decay_t<A0>> && !std::is_same_v<std::decay_t<A0>, std::source_location>)
        explicit error(const std::string_view fmt, A0 &&a0, Args&&... a)
            : error { true, format(fmt::runtime(fmt), std::forward<A0>(a0), std::forward<Args>(a)...) }
        {
        }
    protected:
        explicit error(bool trace, const std::string &msg);
    };

    struct error_sys: error {
        explicit error_sys(const std::string &msg, const std::source_location &loc=std::source_location::current());
    };

    // Configuration and protocol-version mismatches that must stop the process.
    struct fatal_error: error {
        using error::error;
    };
}

#endif // !GRAPH_SENTINEL_ERROR_HPP
