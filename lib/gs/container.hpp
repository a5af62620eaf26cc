#pragma once
#ifndef GRAPH_SENTINEL_CONTAINER_HPP
#define GRAPH_SENTINEL_CONTAINER_HPP
/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <map>
#include <set>
#include <vector>
#include <boost/container/flat_set.hpp>
#include <boost/container/flat_map.hpp>
#include <gs/error.hpp>

namespace graph_sentinel {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    using map = std::map<K, V>;

    template<typename T, typename C=std::less<T>>
    using set = std::set<T, C>;

    template<typename K>
    struct flat_set: boost::container::flat_set<K> {
        using base_type = boost::container::flat_set<K>;
        using base_type::base_type;

        const typename base_type::value_type &at(const size_t idx) const
        {
            if (idx >= base_type::size()) [[unlikely]]
                throw error(fmt::format("flat_set index out of range: {} >= {}", idx, base_type::size()));
            auto it = base_type::cbegin() + idx;
            return *it;
        }
    };

    template<typename K, typename V>
    struct flat_map: boost::container::flat_map<K, V> {
        using base_type = boost::container::flat_map<K, V>;
        using base_type::base_type;
    };
}

namespace fmt {
    template<typename T>
    struct formatter<graph_sentinel::flat_set<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "[");
            for (auto it = v.begin(); it != v.end(); ++it) {
                const std::string sep { std::next(it) == v.end() ? "" : ", " };
                out_it = fmt::format_to(out_it, "{}{}", *it, sep);
            }
            return fmt::format_to(out_it, "]");
        }
    };
}

#endif //!GRAPH_SENTINEL_CONTAINER_HPP
